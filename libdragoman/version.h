/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef _VERSION_H_
#define _VERSION_H_

#define CODENAME "Sumer"

#define STRINGIZE(x) #x
#define MAKE_VERSION(a,b,c) STRINGIZE(a) "." STRINGIZE(b) "." STRINGIZE(c)

#define DRAGOMAN_VERSION_MAJOR 0
#define DRAGOMAN_VERSION_MINOR 3
#define DRAGOMAN_VERSION_MICRO 1
#define DRAGOMAN_VERSION MAKE_VERSION(DRAGOMAN_VERSION_MAJOR, DRAGOMAN_VERSION_MINOR, DRAGOMAN_VERSION_MICRO)
#define VERSION DRAGOMAN_VERSION

#endif
