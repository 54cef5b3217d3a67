#ifndef QSNEST_LOG_H
#define QSNEST_LOG_H

#include <exception>
#include <string_view>

namespace qsnest::logging
{

// Report a failure
void fail(const std::exception&, char const*);

bool set_log_level(std::string_view);

} // namespace qsnest::logging

#endif // QSNEST_LOG_H
