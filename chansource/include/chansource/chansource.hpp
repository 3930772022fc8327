#pragma once

/// Main header for the chansource library
///
/// chansource reads characters out of files (or any byte channel) while
/// keeping an exact byte position that can be queried and sought to at any
/// time.
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - UTF-8 and ISO-8859-1 decoding, robust to sequences split across reads
/// - Buffered or memory-mapped I/O behind the same interface
/// - Line iteration sharing the character cursor
///
/// Example usage:
/// ```cpp
/// #include <chansource/chansource.hpp>
///
/// using namespace chansource;
///
/// FileChannel file("notes.txt");
/// auto source = ChannelSource<FileChannel>::create(file);
/// if (!source) {
///     // Handle source.error()
/// }
///
/// auto lines = source.value().lines();
/// while (lines.has_next()) {
///     auto line = lines.next();
///     if (line) {
///         std::size_t offset = source.value().position();
///         // offset is the byte position right after this line
///     }
/// }
/// ```

#include "types/result.hpp"
#include "types/encoding.hpp"
#include "channel_base.hpp"
#include "channels/channel_buffer.hpp"
#if defined(__unix__) || defined(__APPLE__)
#include "channels/channel_unix_file.hpp"
#endif
#include "decoder.hpp"
#include "window.hpp"
#include "channel_source.hpp"
#include "line_iterator.hpp"
