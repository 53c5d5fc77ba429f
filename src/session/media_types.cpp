#include "torrentcast/session/media_types.hpp"
#include "torrentcast/core/utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace torrentcast::session {

namespace {

constexpr std::array<std::string_view, 4> PLAYABLE_EXTENSIONS = {".mp4", ".mkv", ".avi", ".webm"};
constexpr std::array<std::string_view, 3> AUDIO_EXTENSIONS = {".mp3", ".m4a", ".aac"};

constexpr std::array<std::pair<std::string_view, std::string_view>, 4> MIME_TYPES = {{
    {".mp4", "video/mp4"},
    {".mkv", "video/x-matroska"},
    {".avi", "video/x-msvideo"},
    {".webm", "video/webm"},
}};

template<size_t N>
bool has_extension(const std::string& filename, const std::array<std::string_view, N>& table) {
    auto extension = core::utils::FileUtils::get_file_extension(filename);
    return std::find(table.begin(), table.end(), extension) != table.end();
}

}

bool is_playable_file(const std::string& filename) {
    return has_extension(filename, PLAYABLE_EXTENSIONS);
}

bool is_audio_file(const std::string& filename) {
    return has_extension(filename, AUDIO_EXTENSIONS);
}

std::string mime_type_for(const std::string& filename) {
    auto extension = core::utils::FileUtils::get_file_extension(filename);
    for (const auto& [ext, mime] : MIME_TYPES) {
        if (ext == extension) {
            return std::string(mime);
        }
    }
    return "application/octet-stream";
}

std::optional<std::size_t> select_playable_file(const std::vector<engine::FileEntry>& files) {
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (is_playable_file(files[i].name)) {
            return i;
        }
    }
    return std::nullopt;
}

std::string sanitize_filename(const std::string& filename) {
    std::string result = filename;
    for (auto& c : result) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '-') {
            c = '_';
        }
    }
    return result;
}

}
