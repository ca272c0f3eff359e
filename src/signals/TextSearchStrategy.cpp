#include "signals/TextSearchStrategy.hpp"
#include "core/PathResolver.hpp"
#include <spdlog/spdlog.h>
#include <regex>

namespace obs_sitter {

TextSearchStrategy::TextSearchStrategy(std::filesystem::path repo_root)
    : repo_root_(std::move(repo_root)) {
}

std::optional<std::filesystem::path> TextSearchStrategy::resolve(
    const std::string& name,
    const std::filesystem::path& /*current_file*/
) {
    const auto& files = searchable_files();
    std::string escaped = PathResolver::regex_escape(name);

    for (const char* keyword : {"class", "module"}) {
        std::regex pattern(std::string("^\\s*") + keyword + "\\s+" + escaped + "\\b");
        if (auto found = PathResolver::find_first_line_match(files, pattern)) {
            spdlog::debug("Found {} {} in {}", keyword, name, found->string());
            return found;
        }
    }

    return std::nullopt;
}

const std::vector<std::filesystem::path>& TextSearchStrategy::searchable_files() {
    if (!files_) {
        std::vector<std::filesystem::path> files;
        for (const char* top : {"app", "lib"}) {
            for (auto& file : PathResolver::ruby_files(repo_root_ / top)) {
                if (!PathResolver::is_test_path(file, repo_root_)) {
                    files.push_back(std::move(file));
                }
            }
        }
        files_ = std::move(files);
    }
    return *files_;
}

} // namespace obs_sitter
