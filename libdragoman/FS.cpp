/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <algorithm>
#include "FS.h"

#if STD_FILESYSTEM
#include <filesystem>
namespace fs_lib = std::filesystem;
#else
#include <boost/filesystem.hpp>
namespace fs_lib = boost::filesystem;
#endif

namespace dragoman {
namespace fs {
	bool ReadDir(const std::string & path, std::vector<std::string> & files) {
		if (!fs_lib::is_directory(path))
			return false;
		fs_lib::directory_iterator it(path);
		fs_lib::directory_iterator end;

		for ( ; it != end; it++) {
			if (!fs_lib::is_regular_file(it->status()))
				continue;
			files.push_back(it->path().string());
		}
		// directory order is unspecified
		std::sort(files.begin(), files.end());

		return true;
	}

	std::string GetFileName(const std::string & path) {
		return fs_lib::path(path).filename().string();
	}
} // fs
} // dragoman
