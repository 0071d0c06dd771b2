/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef FS_H__
#define FS_H__

#include <vector>
#include <string>

namespace dragoman {
namespace fs {
	/**
	 * @brief Get list of regular files in directory
	 * @param path  Path to directory
	 * @param files Vector to store found files, sorted by path
	 * @return true on success and false if directory not exists
	 */
	bool ReadDir(const std::string & path, std::vector<std::string> & files);

	/** @brief Last path component, '/tmp/a.en.ini' -> 'a.en.ini' */
	std::string GetFileName(const std::string & path);
} // fs
} // dragoman

#endif // FS_H__
