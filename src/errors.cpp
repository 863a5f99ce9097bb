#include "wavmerge/errors.hpp"

#include <iomanip>
#include <sstream>

namespace wavmerge {

InsufficientInputError::InsufficientInputError(std::size_t file_count)
    : MergeError("At least 2 files are required for merging, got " + std::to_string(file_count)),
      count(file_count) {}

DecodeError::DecodeError(const std::string& file_name, const std::string& reason)
    : MergeError("Failed to decode '" + file_name + "': " + reason),
      name(file_name), why(reason) {}

DecodeError::DecodeError(const std::string& message, const std::string& file_name,
                         const std::string& reason, std::size_t file_index)
    : MergeError(message), name(file_name), why(reason), index(file_index), index_known(true) {}

DecodeError DecodeError::with_index(std::size_t file_index, std::size_t file_total) const {
    std::string message = "Failed to decode '" + name + "' (file " + std::to_string(file_index + 1) +
                          " of " + std::to_string(file_total) + "): " + why;
    return DecodeError(message, name, why, file_index);
}

DurationLimitError::DurationLimitError(double limit_seconds, double reached_seconds)
    : MergeError([&] {
          std::ostringstream ss;
          ss << std::fixed << std::setprecision(2)
             << "Merged audio reached " << reached_seconds
             << "s, exceeding the limit of " << limit_seconds << "s";
          return ss.str();
      }()),
      limit(limit_seconds) {}

} // namespace wavmerge
