#ifndef WAVMERGE_ERRORS_HPP
#define WAVMERGE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace wavmerge {

class MergeError : public std::runtime_error {
public:
    explicit MergeError(const std::string& message) : std::runtime_error(message) {}
};

class InsufficientInputError : public MergeError {
public:
    explicit InsufficientInputError(std::size_t file_count);

    std::size_t file_count() const { return count; }

private:
    std::size_t count;
};

// 失敗したファイル名(と位置)を保持する
class DecodeError : public MergeError {
public:
    DecodeError(const std::string& file_name, const std::string& reason);

    std::size_t file_index() const { return index; }
    bool has_file_index() const { return index_known; }
    const std::string& file_name() const { return name; }
    const std::string& reason() const { return why; }

    // merge() がファイル位置を付けて投げ直す
    DecodeError with_index(std::size_t file_index, std::size_t file_total) const;

private:
    DecodeError(const std::string& message, const std::string& file_name,
                const std::string& reason, std::size_t file_index);

    std::string name;
    std::string why;
    std::size_t index = 0;
    bool index_known = false;
};

class EncodeError : public MergeError {
public:
    explicit EncodeError(const std::string& message) : MergeError("Encode failed: " + message) {}
};

class DurationLimitError : public MergeError {
public:
    DurationLimitError(double limit_seconds, double reached_seconds);

    double limit_seconds() const { return limit; }

private:
    double limit;
};

} // namespace wavmerge

#endif // WAVMERGE_ERRORS_HPP
