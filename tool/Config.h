/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef CONFIG_H__
#define CONFIG_H__

#include <string>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

/**
 * Functions to parse and store dragoman parameters
 *
 * General usage flow:
 *   Init() -- early as possible
 *   ParseCmdline() -- somewhere close to main()
 *   ParseConfig() -- after detecting path to config
 *   Finalize() -- right after all Parse*() functions called
 *   GetOption() -- may be called after Finalize()
 */

namespace dragoman {
namespace config {
	extern boost::program_options::variables_map m_Options;

	/**
	 * @brief  Initialize list of acceptable parameters
	 *
	 * Should be called before any Parse* functions.
	 */
	void Init();

	/**
	 * @brief  Parse cmdline parameters, and show help if requested
	 * @param  argc  Cmdline arguments count, should be passed from main().
	 * @param  argv  Cmdline parameters array, should be passed from main()
	 *
	 * If --help is given in parameters, shows its list with description
	 * and terminates the program with exitcode 0.
	 *
	 * In case of parameter misuse boost throws an exception.
	 * We internally handle type boost::program_options::unknown_option,
	 * and then terminate the program with exitcode 1.
	 *
	 * Other exceptions will be passed to higher level.
	 */
	void ParseCmdline(int argc, char* argv[]);

	/**
	 * @brief  Load and parse given config file
	 * @param  path  Path to config file
	 *
	 * If error occurred when opening file path is points to,
	 * we show the error message and terminate program.
	 *
	 * In case of parameter misuse boost throws an exception.
	 * We internally handle type boost::program_options::unknown_option,
	 * and then terminate program with exitcode 1.
	 */
	void ParseConfig(const std::string& path);

	/**
	 * @brief  Used to combine options from cmdline, config and default values
	 */
	void Finalize();

	/**
	 * @brief  Accessor to parameters by name
	 * @param  name  Name of the requested parameter
	 * @param  value Variable where to store option
	 * @return this function returns false if parameter not found
	 *
	 * Example: int64_t count; GetOption("count", count);
	 */
	template<typename T>
	bool GetOption(const char *name, T& value) {
		if (!m_Options.count(name))
			return false;
		value = m_Options[name].as<T>();
		return true;
	}

	template<typename T>
	bool GetOption(const std::string& name, T& value)
	{
		return GetOption (name.c_str (), value);
	}

	/**
	 * @brief  Check is value explicitly given or default
	 * @param  name  Name of checked parameter
	 * @return true if value set to default, false otherwise
	 */
	bool IsDefault(const char *name);
} // config
} // dragoman

#endif // CONFIG_H__
