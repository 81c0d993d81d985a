#include "archive/archive_lookup.hpp"

#include "log/log.hpp"

#include <string>

namespace comexe::archive {

auto read_current_entry_fully(ArchiveReader& reader) -> Result<std::string, ArchiveError> {
    auto info = reader.current_entry_info();
    if (!info) {
        return ArchiveError{"no current entry"};
    }
    if (reader.open_current_entry() != ArchiveStatus::Ok) {
        return ArchiveError{"cannot open entry " + info->name};
    }

    std::string content;
    content.reserve(static_cast<size_t>(info->uncompressed_size));
    while (true) {
        auto chunk = reader.read_current_entry(READ_CHUNK);
        if (is_err(chunk)) {
            if (reader.close_current_entry() != ArchiveStatus::Ok) {
                COMEXE_LOG_DEBUG("archive", "close failed after read error on " << info->name);
            }
            return unwrap_err(chunk);
        }
        if (unwrap(chunk).empty()) {
            break;
        }
        content += unwrap(chunk);
    }

    if (content.size() != info->uncompressed_size) {
        if (reader.close_current_entry() != ArchiveStatus::Ok) {
            COMEXE_LOG_DEBUG("archive", "close failed after short read on " << info->name);
        }
        return ArchiveError{"entry " + info->name + " ended after " + std::to_string(content.size()) +
                            " of " + std::to_string(info->uncompressed_size) + " bytes"};
    }

    if (reader.close_current_entry() != ArchiveStatus::Ok) {
        return ArchiveError{"integrity check failed for " + info->name};
    }
    return content;
}

auto find_entry(ArchiveReader& reader, std::string_view name) -> std::optional<std::string> {
    auto status = reader.goto_first_entry();
    while (status == ArchiveStatus::Ok) {
        auto info = reader.current_entry_info();
        if (info && info->name == name) {
            if (info->uncompressed_size == 0) {
                return std::string();
            }
            auto content = read_current_entry_fully(reader);
            if (is_err(content)) {
                COMEXE_LOG_WARN("archive", unwrap_err(content).message);
                return std::nullopt;
            }
            return std::move(unwrap(content));
        }
        status = reader.goto_next_entry();
    }
    if (status == ArchiveStatus::Error) {
        COMEXE_LOG_WARN("archive", "entry scan aborted while looking for " << name);
    }
    return std::nullopt;
}

auto for_each_entry(ArchiveReader& reader, const EntryVisitor& visitor) -> ArchiveStatus {
    bool stopped = false;
    auto status = reader.goto_first_entry();
    while (status == ArchiveStatus::Ok) {
        auto info = reader.current_entry_info();
        if (!info) {
            return ArchiveStatus::Error;
        }
        EntryVisit visit{*info, [&reader] { return read_current_entry_fully(reader); },
                         [&stopped] { stopped = true; }};
        visitor(visit);
        if (stopped) {
            return ArchiveStatus::Ok;
        }
        status = reader.goto_next_entry();
    }
    return status;
}

} // namespace comexe::archive
