#pragma once
#include <string>

// Path of this test executable; tests that need a second process re-exec it in a worker mode.
extern std::string g_self_exe_path;
