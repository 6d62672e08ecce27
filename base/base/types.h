#pragma once

#include <string>
#include <vector>

using String = std::string;
using Strings = std::vector<String>;
