#include "../../include/task.hpp"
#include "../../include/random_utils.hpp"
#include <atomic>
#include <unistd.h>

namespace crusher {

    std::vector<std::string> parse_engines(const std::string_view list) {
        std::vector<std::string> engines;
        std::size_t start = 0;
        while (start <= list.size()) {
            std::size_t comma = list.find(',', start);
            if (comma == std::string_view::npos) comma = list.size();

            std::string_view item = list.substr(start, comma - start);
            const auto first = item.find_first_not_of(" \t\r\n");
            if (first != std::string_view::npos) {
                const auto last = item.find_last_not_of(" \t\r\n");
                engines.emplace_back(item.substr(first, last - first + 1));
            }
            start = comma + 1;
        }
        return engines;
    }

    std::string join_engines(const std::vector<std::string>& engines) {
        std::string out;
        for (const auto& engine : engines) {
            if (!out.empty()) out += ", ";
            out += engine;
        }
        return out;
    }

    Task make_task(const std::string_view engines,
                   std::string extension,
                   std::string content,
                   const bool gzip,
                   TaskId id) {
        Task task;
        task.id = std::move(id);
        task.engines = parse_engines(engines);
        task.extension = std::move(extension);
        task.content = std::move(content);
        task.gzip = gzip;
        return task;
    }

    TaskId generate_task_id() {
        static std::atomic<std::uint64_t> counter{0};
        const auto seq = counter.fetch_add(1, std::memory_order_relaxed) + 1;
        return std::to_string(::getpid()) + "-" + std::to_string(seq) + "-" + RandomUtils::random_suffix();
    }

} // namespace crusher
