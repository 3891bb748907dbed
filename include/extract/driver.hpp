//! # Directory Driver
//!
//! Walks a contracts directory and assembles one `Contract` per source file.
//!
//! ## Ordering
//!
//! Files are collected in `recursive_directory_iterator` order, which is
//! filesystem order, not sorted. With `jobs > 1` files are assembled on a
//! worker pool, but each result is stored at its file's index, so the
//! returned list always follows traversal order.
//!
//! ## Failure
//!
//! A missing root, or a root that is not a directory, fails before any file
//! is read. A file that cannot be read fails the whole run: no matching
//! file is silently dropped.

#ifndef VYDOC_EXTRACT_DRIVER_HPP
#define VYDOC_EXTRACT_DRIVER_HPP

#include "common.hpp"
#include "model/contract.hpp"
#include "types/vocabulary.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace vydoc::extract {

struct DriverConfig {
    std::string extension = ".vy";
    unsigned jobs = 1; ///< 0 uses every hardware thread.
    types::TypeVocabulary vocabulary = types::TypeVocabulary::standard();
};

/// Source files under `root` with the configured extension, in traversal order.
[[nodiscard]] auto find_contract_files(const std::filesystem::path& root,
                                       const DriverConfig& config)
    -> Result<std::vector<std::filesystem::path>, std::string>;

/// Assembles every contract under `root`.
[[nodiscard]] auto collect_contracts(const std::filesystem::path& root,
                                     const DriverConfig& config = {})
    -> Result<std::vector<model::Contract>, std::string>;

} // namespace vydoc::extract

#endif // VYDOC_EXTRACT_DRIVER_HPP
