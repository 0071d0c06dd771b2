/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <algorithm>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include "Log.h"
#include "FS.h"
#include "Error.h"
#include "CatalogueLoader.h"

namespace dragoman
{
namespace loader
{
	static std::string GetExtension (const std::string& fileName)
	{
		auto pos = fileName.rfind ('.');
		if (pos == std::string::npos) return "";
		return fileName.substr (pos + 1);
	}

	static bool IsSupportedExtension (const std::string& ext)
	{
		return ext == CATALOGUE_EXT_INI || ext == CATALOGUE_EXT_JSON;
	}

	void LoadFile (const std::string& path, const std::string& domain, Catalogue& catalogue)
	{
		auto ext = GetExtension (fs::GetFileName (path));
		if (!IsSupportedExtension (ext))
			throw LoaderError (path, "unsupported catalogue format '" + ext + "'");

		boost::property_tree::ptree pt;
		try
		{
			if (ext == CATALOGUE_EXT_INI)
				boost::property_tree::read_ini (path, pt);
			else
				boost::property_tree::read_json (path, pt);
		}
		catch (boost::property_tree::ptree_error& ex)
		{
			throw LoaderError (path, std::string ("can't read catalogue: ") + ex.what ());
		}

		size_t numMessages = 0;
		for (const auto& it: pt)
		{
			if (it.first.empty ())
				throw LoaderError (path, "expected an object of messages");
			if (!it.second.empty ())
				throw LoaderError (path, "message '" + it.first + "' is not a string, catalogues must be flat");
			auto previous = catalogue.Insert (domain, it.first, it.second.data ());
			if (previous)
				LogPrint (eLogDebug, "Loader: '", it.first, "' in '", domain, "' domain for ", catalogue.GetLocale (), " redefined by ", path);
			numMessages++;
		}
		LogPrint (eLogDebug, "Loader: ", numMessages, " messages read from ", path);
	}

	CatalogueBag LoadDirectory (const std::string& path, const std::vector<std::string>& extensions)
	{
		for (const auto& ext: extensions)
			if (!IsSupportedExtension (ext))
				throw LoaderError (path, "unsupported catalogue format '" + ext + "'");

		std::vector<std::string> files;
		if (!fs::ReadDir (path, files))
			throw LoaderError (path, "catalogue directory doesn't exist");

		CatalogueBag bag;
		for (const auto& file: files)
		{
			auto fileName = fs::GetFileName (file);
			if (fileName.empty () || fileName[0] == '.') continue; // hidden
			auto ext = GetExtension (fileName);
			if (std::find (extensions.begin (), extensions.end (), ext) == extensions.end ())
			{
				LogPrint (eLogDebug, "Loader: Skipped ", file);
				continue;
			}
			// {domain}.{locale}.{ext}, domain may contain dots
			auto stem = fileName.substr (0, fileName.length () - ext.length () - 1);
			auto pos = stem.rfind ('.');
			if (pos == std::string::npos || pos == 0 || pos + 1 == stem.length ())
				throw LoaderError (file, "expected file name '{domain}.{locale}." + ext + "'");
			auto domain = stem.substr (0, pos);
			std::optional<Locale> locale;
			try
			{
				locale = Locale::FromTag (stem.substr (pos + 1));
			}
			catch (LocaleParseError& ex)
			{
				throw LoaderError (file, ex.what ());
			}
			Catalogue catalogue (*locale);
			LoadFile (file, domain, catalogue);
			bag.Insert (std::move (catalogue));
		}
		LogPrint (eLogInfo, "Loader: ", bag.GetNumCatalogues (), " catalogues loaded from ", path);
		return bag;
	}
}
}
