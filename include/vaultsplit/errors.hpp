#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace vaultsplit {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class KeyDerivationError : public Error {
public:
    using Error::Error;
};

// Wrong password and corrupted ciphertext are indistinguishable: CBC with
// PKCS7 carries no MAC, so malformed padding is the only signal.
class PaddingError : public Error {
public:
    explicit PaddingError(const std::string& message, std::vector<std::size_t> chunk_indices = {});

    const std::vector<std::size_t>& ChunkIndices() const noexcept { return chunk_indices_; }

private:
    std::vector<std::size_t> chunk_indices_;
};

class TruncatedContainerError : public Error {
public:
    TruncatedContainerError(const std::string& message, std::size_t offset, std::size_t claimed, std::size_t remaining);

    std::size_t Offset() const noexcept { return offset_; }
    std::size_t Claimed() const noexcept { return claimed_; }
    std::size_t Remaining() const noexcept { return remaining_; }

private:
    std::size_t offset_;
    std::size_t claimed_;
    std::size_t remaining_;
};

class InsufficientSpaceError : public Error {
public:
    InsufficientSpaceError(const std::string& destination, std::uint64_t required, std::uint64_t available);

    std::uint64_t Required() const noexcept { return required_; }
    std::uint64_t Available() const noexcept { return available_; }

private:
    std::uint64_t required_;
    std::uint64_t available_;
};

class MissingFragmentsError : public Error {
public:
    explicit MissingFragmentsError(std::vector<std::string> names);

    const std::vector<std::string>& Names() const noexcept { return names_; }

private:
    std::vector<std::string> names_;
};

struct ChecksumMismatch {
    std::string name;
    std::string expected;
    std::string actual;
};

class CorruptFragmentError : public Error {
public:
    explicit CorruptFragmentError(std::vector<ChecksumMismatch> mismatches);

    const std::vector<ChecksumMismatch>& Mismatches() const noexcept { return mismatches_; }

private:
    std::vector<ChecksumMismatch> mismatches_;
};

class SizeMismatchError : public Error {
public:
    SizeMismatchError(std::uint64_t expected, std::uint64_t actual);

    std::uint64_t Expected() const noexcept { return expected_; }
    std::uint64_t Actual() const noexcept { return actual_; }

private:
    std::uint64_t expected_;
    std::uint64_t actual_;
};

class ManifestError : public Error {
public:
    using Error::Error;
};

class CancelledError : public Error {
public:
    using Error::Error;
};

class IoError : public Error {
public:
    using Error::Error;
};

}  // namespace vaultsplit
