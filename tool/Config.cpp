/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <cstdlib>
#include <inttypes.h>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <stdexcept>
#include <boost/program_options/cmdline.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include "Config.h"
#include "version.h"

using namespace boost::program_options;

namespace dragoman {
namespace config {
	options_description m_OptionsDesc;
	variables_map       m_Options;

	void Init() {
		options_description general("General options");
		general.add_options()
			("help",     "Show this message")
			("version",  "Show dragoman version")
			("conf",     value<std::string>()->default_value(""),     "Path to config file with any of the options below")
			("log",      value<std::string>()->default_value("stderr"), "Logs destination: stderr, stdout, file, syslog")
			("logfile",  value<std::string>()->default_value(""),     "Path to logfile (default: dragoman.log)")
			("loglevel", value<std::string>()->default_value("warn"), "Set the minimal level of log messages (debug, info, warn, error, none)")
			;

		options_description catalogues("Catalogue options");
		catalogues.add_options()
			("catalogues", value<std::string>()->default_value(""),  "Directory with {domain}.{locale}.{ext} catalogue files")
			("ext",        value<std::vector<std::string> >()->composing(), "Catalogue file extension to load: ini, json (default: both)")
			("fallback",   value<std::string>()->default_value(""),  "Locale tried after the requested one and its parents")
			("check",      value<bool>()->zero_tokens()->default_value(false), "Report malformed templates and exit")
			("list",       value<bool>()->zero_tokens()->default_value(false), "List loaded locales and domains and exit")
			;

		options_description translate("Translation options");
		translate.add_options()
			("locale", value<std::string>()->default_value(""),         "Locale tag, e.g. en or zh_CN")
			("domain", value<std::string>()->default_value("messages"), "Message domain")
			("id",     value<std::string>()->default_value(""),         "Message id")
			("count",  value<int64_t>()->default_value(0),              "Count used for plural selection")
			("arg",    value<std::vector<std::string> >()->composing(), "Named value for interpolation, name=value")
			;

		m_OptionsDesc
			.add(general)
			.add(catalogues)
			.add(translate)
			;
	}

	void ParseCmdline(int argc, char* argv[]) {
		try {
			auto style = boost::program_options::command_line_style::unix_style
			           | boost::program_options::command_line_style::allow_long_disguise;
			style &=   ~ boost::program_options::command_line_style::allow_guessing;
			store(parse_command_line(argc, argv, m_OptionsDesc, style), m_Options);
		} catch (boost::program_options::error& e) {
			std::cerr << "args: " << e.what() << std::endl;
			exit(EXIT_FAILURE);
		}

		if (m_Options.count("help") || m_Options.count("h")) {
			std::cout << "dragoman version " << DRAGOMAN_VERSION << " (" << CODENAME << ")" << std::endl;
			std::cout << m_OptionsDesc;
			exit(EXIT_SUCCESS);
		}
		if (m_Options.count("version")) {
			std::cout << "dragoman version " << DRAGOMAN_VERSION << std::endl;
			exit(EXIT_SUCCESS);
		}
	}

	void ParseConfig(const std::string& path) {
		if (path == "") return;

		std::ifstream config(path, std::ios::in);

		if (!config.is_open())
		{
			std::cerr << "missing/unreadable config file: " << path << std::endl;
			exit(EXIT_FAILURE);
		}

		try
		{
			store(boost::program_options::parse_config_file(config, m_OptionsDesc), m_Options);
		}
		catch (boost::program_options::error& e)
		{
			std::cerr << e.what() << std::endl;
			exit(EXIT_FAILURE);
		};
	}

	void Finalize() {
		try {
			notify(m_Options);
		} catch (boost::program_options::error& e) {
			std::cerr << "args: " << e.what() << std::endl;
			exit(EXIT_FAILURE);
		}
	}

	bool IsDefault(const char *name) {
		if (!m_Options.count(name))
			throw std::invalid_argument(std::string("try to check non-existent option ") + name);

		if (m_Options[name].defaulted())
			return true;
		return false;
	}
} // namespace config
} // namespace dragoman
