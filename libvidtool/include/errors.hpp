/**
 * @file errors.hpp
 * @brief Exception taxonomy of the batch transcode engine.
 */

#ifndef VIDTOOL_ERRORS_HPP
#define VIDTOOL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace vidtool {

/**
 * @brief Base class of every error raised by libvidtool.
 */
class VidtoolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Failure to obtain a MediaDescriptor for a file.
 */
class ProbeError : public VidtoolError {
public:
    enum class Kind {
        NotFound,        ///< The file does not exist or is not readable
        ToolMissing,     ///< The probe binary could not be located
        MalformedOutput, ///< The probe tool output could not be parsed
        ToolTimeout,     ///< The probe tool did not finish in time
        ToolFailed       ///< The probe tool exited with a non-zero status
    };

    ProbeError(const Kind kind, const std::string& message)
        : VidtoolError(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/**
 * @brief Failure of a Selector evaluation as a whole.
 */
class SelectionError : public VidtoolError {
public:
    enum class Kind {
        PathNotFound, ///< A root path does not exist
        BadPattern    ///< A name pattern could not be compiled
    };

    SelectionError(const Kind kind, const std::string& message)
        : VidtoolError(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/**
 * @brief Failure to turn a naming pattern into a usable output path.
 */
class TemplateError : public VidtoolError {
public:
    enum class Kind {
        UnknownPlaceholder, ///< Placeholder outside the fixed vocabulary
        MalformedPattern,   ///< Unbalanced braces or empty result
        CollisionDenied,    ///< Output exists and the policy is no-clobber
        SameAsInput,        ///< Output would overwrite the source file
        NoFreeName          ///< Increment policy ran out of candidate names
    };

    TemplateError(const Kind kind, const std::string& message)
        : VidtoolError(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/**
 * @brief Contradictory transcode options.
 */
class OptionConflict : public VidtoolError {
public:
    using VidtoolError::VidtoolError;
};

/**
 * @brief Failure of one transcode job.
 */
class JobError : public VidtoolError {
public:
    enum class Kind {
        ToolMissing,      ///< The transcode binary could not be located
        NonZeroExit,      ///< The tool exited with a non-zero status
        Killed,           ///< The tool was terminated by a signal
        OutputWriteFailed ///< The output could not be moved into place
    };

    JobError(const Kind kind, const std::string& message)
        : VidtoolError(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/**
 * @brief Failure of a PresetStore operation.
 */
class PresetError : public VidtoolError {
public:
    enum class Kind {
        NotFound,      ///< No preset with the requested name
        InvalidName,   ///< Empty or blank preset name
        AlreadyExists, ///< Rename target already taken
        Unreadable,    ///< Store or import file cannot be read or parsed
        WriteFailed    ///< Store or export file cannot be written
    };

    PresetError(const Kind kind, const std::string& message)
        : VidtoolError(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/**
 * @brief Invalid or unreadable configuration file.
 */
class ConfigError : public VidtoolError {
public:
    using VidtoolError::VidtoolError;
};

} // namespace vidtool

#endif // VIDTOOL_ERRORS_HPP
