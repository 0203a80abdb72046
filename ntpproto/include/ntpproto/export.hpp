// Copyright (c) 2025
#pragma once

#if defined(_WIN32)
#if defined(NTPPROTO_BUILDING_DLL)
#define NTPPROTO_API __declspec(dllexport)
#elif defined(NTPPROTO_SHARED)
#define NTPPROTO_API __declspec(dllimport)
#else
#define NTPPROTO_API
#endif
#else
#define NTPPROTO_API
#endif
