/**
 * @file command_builder.hpp
 * @brief Translation of TranscodeOptions into a transcode tool command.
 */

#ifndef VIDTOOL_COMMAND_BUILDER_HPP
#define VIDTOOL_COMMAND_BUILDER_HPP

#include "command_spec.hpp"
#include "media_descriptor.hpp"
#include "transcode_options.hpp"

#include <filesystem>

namespace vidtool {

/**
 * @brief Build the command that transcodes @p descriptor into @p output.
 *
 * @details Starts from "copy every stream" and applies, in order:
 * av-copy-only, explicit codecs (and the x265 shortcut), strip flags,
 * resolution fix, error tolerance, custom flags. Stream kinds are only
 * mapped out when the source actually has them. The function is pure:
 * it neither touches the filesystem nor spawns anything.
 *
 * @throws OptionConflict if @p options fail validation or if no stream
 *         would remain in the output.
 */
CommandSpec build_command(const MediaDescriptor& descriptor,
                          const TranscodeOptions& options,
                          const std::filesystem::path& output);

} // namespace vidtool

#endif // VIDTOOL_COMMAND_BUILDER_HPP
