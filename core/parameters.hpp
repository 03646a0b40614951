#pragma once
#include <string>
#include <vector>

struct Parameters
{
	std::string config_path;
	// read from standard input if empty
	std::vector<std::string> paths;
};
