#include "vaultsplit/errors.hpp"

#include <sstream>
#include <utility>

namespace vaultsplit {

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += names[i];
    }
    return out;
}

std::string DescribeMismatches(const std::vector<ChecksumMismatch>& mismatches) {
    std::ostringstream out;
    out << "Corrupt fragments (" << mismatches.size() << "):";
    for (const auto& item : mismatches) {
        out << " " << item.name << " [expected " << item.expected << ", actual " << item.actual << "]";
    }
    return out.str();
}

}  // namespace

PaddingError::PaddingError(const std::string& message, std::vector<std::size_t> chunk_indices)
    : Error(message), chunk_indices_(std::move(chunk_indices)) {}

TruncatedContainerError::TruncatedContainerError(const std::string& message,
                                                 std::size_t offset,
                                                 std::size_t claimed,
                                                 std::size_t remaining)
    : Error(message + " (offset " + std::to_string(offset) + ", claimed " + std::to_string(claimed)
            + " bytes, remaining " + std::to_string(remaining) + ")"),
      offset_(offset),
      claimed_(claimed),
      remaining_(remaining) {}

InsufficientSpaceError::InsufficientSpaceError(const std::string& destination,
                                               std::uint64_t required,
                                               std::uint64_t available)
    : Error("Insufficient space at " + destination + ": required " + std::to_string(required)
            + " bytes, available " + std::to_string(available)),
      required_(required),
      available_(available) {}

MissingFragmentsError::MissingFragmentsError(std::vector<std::string> names)
    : Error("Missing fragments (" + std::to_string(names.size()) + "): " + JoinNames(names)),
      names_(std::move(names)) {}

CorruptFragmentError::CorruptFragmentError(std::vector<ChecksumMismatch> mismatches)
    : Error(DescribeMismatches(mismatches)), mismatches_(std::move(mismatches)) {}

SizeMismatchError::SizeMismatchError(std::uint64_t expected, std::uint64_t actual)
    : Error("Size mismatch: expected " + std::to_string(expected) + " bytes, actual " + std::to_string(actual)),
      expected_(expected),
      actual_(actual) {}

}  // namespace vaultsplit
