#ifndef CRUSHER_FILE_SCANNER_HPP
#define CRUSHER_FILE_SCANNER_HPP

#include <vector>
#include <filesystem>

struct Settings; // Forward declaration

/**
 * @brief Expand the command line inputs into the list of files to crush.
 *
 * Directories are listed (recursively with -r); junk files and files
 * rejected by the include/exclude patterns are dropped. Stdin ('-') is
 * handled by the caller and never appears in the result.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const Settings& settings);

#endif //CRUSHER_FILE_SCANNER_HPP
