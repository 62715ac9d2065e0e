#include "json.hpp"
#include "matching.hpp"

#include <fstream>
#include <iostream>
#include <string_view>

int main(int argc, char *argv[])
{
	using namespace utfjson;

	bool print = false;
	ReadingOptions options;
	const char* file = nullptr;
	for (int i = 1; i < argc; ++i)
	{
		const std::string_view arg = argv[i];
		if (arg == "-p") print = true;
		else if (arg == "-f") options.allow_fragments = true;
		else file = argv[i];
	}
	if (file == nullptr)
	{
		std::cerr << "usage: " << argv[0] << " [-p] [-f] <file>\n";
		return 2;
	}

	std::ifstream f(file, std::ios::binary);
	return match(decode(f, options),
		[&](Json&& json){
			if (not print)
			{
				std::cout << "OK\n";
				return 0;
			}
			return match(write(json, std::cout, {.pretty_printed = true}),
				[](std::size_t){
					std::cout << "\n";
					return 0;
				},
				[](Err&& e){
					std::cout << "Error " << e << "\n";
					return 1;
				});
		},
		[](Err&& e){
			std::cout << "Error " << e << "\n";
			return 1;
		});
}
