/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <stdlib.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Config.h"
#include "Log.h"
#include "Error.h"
#include "Context.h"
#include "CatalogueLoader.h"
#include "Translator.h"
#include "version.h"

static void InitLog ()
{
	std::string logs     = ""; dragoman::config::GetOption("log",      logs);
	std::string logfile  = ""; dragoman::config::GetOption("logfile",  logfile);
	std::string loglevel = ""; dragoman::config::GetOption("loglevel", loglevel);

	if (!dragoman::log::Logger().SetLogLevel(loglevel))
		std::cerr << "dragoman: unknown loglevel '" << loglevel << "', keeping default" << std::endl;
	if (logs == "file") {
		if (logfile == "")
			logfile = "dragoman.log";
		dragoman::log::Logger().SendTo (logfile);
#ifndef _WIN32
	} else if (logs == "syslog") {
		dragoman::log::Logger().SendTo("dragoman", LOG_USER);
#endif
	} else if (logs == "stdout") {
		// default
	} else {
		// keep stdout for translations
		dragoman::log::Logger().SendTo (std::shared_ptr<std::ostream>(&std::cerr, [](std::ostream *) {}));
	}
	dragoman::log::Logger().Ready();
}

static dragoman::Context ReadContext ()
{
	dragoman::Context context;
	std::vector<std::string> args;
	dragoman::config::GetOption("arg", args);
	for (const auto& arg: args)
	{
		auto pos = arg.find ('=');
		if (pos == std::string::npos || pos == 0)
		{
			LogPrint (eLogWarning, "Dragoman: Ignored malformed argument '", arg, "', expected name=value");
			continue;
		}
		context.Set (arg.substr (0, pos), arg.substr (pos + 1));
	}
	if (!dragoman::config::IsDefault("count"))
	{
		int64_t count; dragoman::config::GetOption("count", count);
		context.SetCount (count);
	}
	return context;
}

static void List (const dragoman::CatalogueBag& bag)
{
	for (const auto& it: bag.GetCatalogues ())
	{
		std::cout << it.first << " (" << it.first.GetLanguageName () << ")" << std::endl;
		for (const auto& domain: it.second.GetDomains ())
		{
			auto messages = it.second.GetAll (domain);
			std::cout << "\t" << domain << ": " << (messages ? messages->size () : 0) << " messages" << std::endl;
		}
	}
}

static int Run ()
{
	std::string dir; dragoman::config::GetOption("catalogues", dir);
	if (dir.empty ())
	{
		std::cerr << "dragoman: --catalogues is required" << std::endl;
		return EXIT_FAILURE;
	}
	std::vector<std::string> extensions;
	dragoman::config::GetOption("ext", extensions);
	if (extensions.empty ())
		extensions = { dragoman::loader::CATALOGUE_EXT_INI, dragoman::loader::CATALOGUE_EXT_JSON };

	std::optional<dragoman::Locale> fallback;
	std::string fallbackTag; dragoman::config::GetOption("fallback", fallbackTag);
	if (!fallbackTag.empty ())
		fallback = dragoman::Locale::FromTag (fallbackTag);

	auto bag = std::make_shared<const dragoman::CatalogueBag> (dragoman::loader::LoadDirectory (dir, extensions));
	dragoman::Translator translator (bag, fallback);

	bool list; dragoman::config::GetOption("list", list);
	if (list)
	{
		List (*bag);
		return EXIT_SUCCESS;
	}

	bool check; dragoman::config::GetOption("check", check);
	if (check)
	{
		auto issues = translator.Check ();
		for (const auto& issue: issues)
			std::cout << issue.locale << " " << issue.domain << " '" << issue.id << "': " << issue.reason << std::endl;
		return issues.empty () ? EXIT_SUCCESS : EXIT_FAILURE;
	}

	std::string locale; dragoman::config::GetOption("locale", locale);
	std::string domain; dragoman::config::GetOption("domain", domain);
	std::string id;     dragoman::config::GetOption("id",     id);
	if (locale.empty () || id.empty ())
	{
		std::cerr << "dragoman: --locale and --id are required, see --help" << std::endl;
		return EXIT_FAILURE;
	}
	std::cout << translator.Translate (std::string_view (locale), domain, id, ReadContext ()) << std::endl;
	return EXIT_SUCCESS;
}

int main (int argc, char* argv[])
{
	// nothing is written until the destination is known
	dragoman::log::Logger().Hold();
	dragoman::config::Init();
	dragoman::config::ParseCmdline(argc, argv);
	std::string config; dragoman::config::GetOption("conf", config);
	dragoman::config::ParseConfig(config);
	dragoman::config::Finalize();

	InitLog ();
	LogPrint(eLogInfo, "Dragoman v", VERSION, " starting");
	LogPrint(eLogDebug, "Dragoman: config file: ", config);

	int ret = EXIT_FAILURE;
	try
	{
		ret = Run ();
	}
	catch (dragoman::TranslationError& ex)
	{
		LogPrint (eLogError, "Dragoman: ", ex.what ());
		if (dragoman::log::Logger().GetLogType () != eLogStream) // already on stderr
			std::cerr << "dragoman: " << ex.what () << std::endl;
	}
	dragoman::log::Logger().Flush();
	return ret;
}
