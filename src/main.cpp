#include <syslog.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

#include "qsnest/errors.hpp"
#include "qsnest/log.hpp"
#include "qsnest/parser.hpp"
#include "qsnest/settings.hpp"
#include "qsnest/stringifier.hpp"
#include "qsnest/value.hpp"

static void
usage(const char* argv0)
{
	std::cerr << "Usage: " << argv0 << " [-c config.toml] parse|format [query...]" << std::endl;
	std::cerr << "Without a query, one query is read per line of standard input." << std::endl;
}

int main(int argc, char* argv[])
{
	// Open the logger
	openlog("qsnest", LOG_PID | LOG_PERROR, LOG_USER);

	std::string config_file{"qsnest.toml"};
	bool config_given = false;
	std::vector<std::string_view> args;

	for(int i = 1; i < argc; i++)
	{
		std::string_view arg{argv[i]};
		if(arg == "-c")
		{
			if(++i == argc)
			{
				usage(argv[0]);
				return EXIT_FAILURE;
			}
			config_file = argv[i];
			config_given = true;
		}
		else if(arg == "-h" || arg == "--help")
		{
			usage(argv[0]);
			return EXIT_SUCCESS;
		}
		else
		{
			args.push_back(arg);
		}
	}

	if(args.empty() || (args.front() != "parse" && args.front() != "format"))
	{
		usage(argv[0]);
		return EXIT_FAILURE;
	}

	bool format = args.front() == "format";
	args.erase(args.begin());

	// Load config data; the default file is optional
	toml::table tbl;
	if(config_given || std::filesystem::exists(config_file))
	{
		try
		{
			tbl = toml::parse_file(config_file);
		}
		catch(const toml::parse_error& err)
		{
			syslog(LOG_ALERT, "Parsing of config file failed: %s", err.what());
			return EXIT_FAILURE;
		}
	}

	qsnest::Settings settings{tbl};

	if(!qsnest::logging::set_log_level(settings.get_log_level()))
	{
		return EXIT_FAILURE;
	}

	try
	{
		qsnest::Config config = settings.get_config();
		qsnest::Parser parser{config, settings.get_parse_options()};
		qsnest::Stringifier stringifier{config, settings.get_stringify_options()};

		auto run = [&](std::string_view query)
		{
			qsnest::Mapping result = parser.parse(query);
			if(format)
				std::cout << stringifier.stringify(result) << std::endl;
			else
				std::cout << qsnest::Value{std::move(result)} << std::endl;
		};

		if(args.empty())
		{
			std::string line;
			while(std::getline(std::cin, line))
				run(line);
		}
		else
		{
			for(auto query : args)
				run(query);
		}
	}
	catch(const qsnest::config_error& e)
	{
		qsnest::logging::fail(e, "Bad configuration");
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
