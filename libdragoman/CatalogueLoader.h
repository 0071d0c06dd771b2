/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef CATALOGUE_LOADER_H__
#define CATALOGUE_LOADER_H__

#include <string>
#include <vector>
#include "Catalogue.h"

namespace dragoman
{
namespace loader
{
	const char CATALOGUE_EXT_INI[] = "ini";
	const char CATALOGUE_EXT_JSON[] = "json";

	/**
	 * @brief Read every '{domain}.{locale}.{ext}' file of a directory
	 * @param path        Catalogue directory
	 * @param extensions  Extensions to pick up, 'ini' and/or 'json'
	 *
	 * Files with other extensions are skipped. Files are read in sorted
	 * order, so a later file wins if two define the same message.
	 * @throws LoaderError
	 */
	CatalogueBag LoadDirectory (const std::string& path,
		const std::vector<std::string>& extensions = { CATALOGUE_EXT_INI, CATALOGUE_EXT_JSON });

	/**
	 * @brief Add messages of one flat ini or json file to catalogue
	 * @param path    File, format is taken from its extension
	 * @param domain  Domain messages go to
	 * @throws LoaderError
	 */
	void LoadFile (const std::string& path, const std::string& domain, Catalogue& catalogue);
}
}

#endif
