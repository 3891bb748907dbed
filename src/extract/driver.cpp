#include "extract/driver.hpp"

#include "extract/assembler.hpp"
#include "log/log.hpp"
#include "source/source.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace vydoc::extract {

namespace fs = std::filesystem;

auto find_contract_files(const fs::path& root, const DriverConfig& config)
    -> Result<std::vector<fs::path>, std::string> {
    std::error_code ec;
    if (!fs::exists(root, ec) || !fs::is_directory(root, ec)) {
        return "invalid source directory: " + root.string();
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return "invalid source directory: " + root.string() + " (" + ec.message() + ")";
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return "invalid source directory: " + root.string() + " (" + ec.message() + ")";
        }
        if (it->is_regular_file(ec) && it->path().extension() == config.extension) {
            VYDOC_LOG_TRACE("driver", "found " << it->path().string());
            files.push_back(it->path());
        }
    }
    return files;
}

auto collect_contracts(const fs::path& root, const DriverConfig& config)
    -> Result<std::vector<model::Contract>, std::string> {
    auto found = find_contract_files(root, config);
    if (is_err(found)) {
        VYDOC_LOG_ERROR("driver", unwrap_err(found));
        return unwrap_err(found);
    }
    const auto& files = unwrap(found);
    VYDOC_LOG_INFO("driver", "found " << files.size() << " contract file(s) under "
                                      << root.string());

    types::TypeResolver resolver(config.vocabulary);
    std::vector<std::optional<model::Contract>> slots(files.size());
    std::optional<std::string> failure;

    // Determine number of threads
    unsigned num_threads = config.jobs;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0)
            num_threads = 4;
    }
    if (files.size() < num_threads) {
        num_threads = static_cast<unsigned>(files.size());
    }

    std::mutex result_mutex;
    std::atomic<size_t> current_index{0};

    auto worker = [&]() {
        while (true) {
            size_t index = current_index.fetch_add(1);
            if (index >= files.size()) {
                break;
            }

            const auto& path = files[index];
            auto loaded = source::Source::from_file(path.string());
            if (is_err(loaded)) {
                std::lock_guard<std::mutex> lock(result_mutex);
                if (!failure) {
                    failure = "failed to read contract " + path.string() + ": " +
                              unwrap_err(loaded);
                }
                continue;
            }

            std::error_code rel_ec;
            auto relative = fs::relative(path, root, rel_ec).generic_string();
            if (rel_ec || relative.empty()) {
                relative = path.filename().string();
            }
            VYDOC_LOG_DEBUG("driver", "assembling " << relative);
            auto contract = assemble(unwrap(loaded), relative, resolver);

            std::lock_guard<std::mutex> lock(result_mutex);
            slots[index] = std::move(contract);
        }
    };

    if (num_threads <= 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        for (unsigned i = 0; i < num_threads; ++i) {
            workers.emplace_back(worker);
        }
        for (auto& thread : workers) {
            thread.join();
        }
    }

    if (failure) {
        VYDOC_LOG_ERROR("driver", *failure);
        return *failure;
    }

    std::vector<model::Contract> contracts;
    contracts.reserve(slots.size());
    for (auto& slot : slots) {
        contracts.push_back(std::move(*slot));
    }
    return contracts;
}

} // namespace vydoc::extract
