#include "persistence/json_file.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace mablocks::json_file {

namespace {

void ensure_parent_directory(const std::filesystem::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec && !std::filesystem::exists(parent)) {
        std::ostringstream oss;
        oss << "Failed to create directory '" << parent.string() << "': " << ec.message();
        throw std::runtime_error(oss.str());
    }
}

}

nlohmann::json read(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Unable to open '" + path.string() + "' for reading.");
    }
    try {
        nlohmann::json data;
        in >> data;
        return data;
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("Malformed JSON in '" + path.string() + "': " + ex.what());
    }
}

void write(const std::filesystem::path& path, const nlohmann::json& data, int indent) {
    ensure_parent_directory(path);

    const std::filesystem::path tmp_path = path.string() + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Unable to open '" + tmp_path.string() + "' for writing.");
        }
        // Paths on disk are not guaranteed to be UTF-8; invalid bytes become U+FFFD.
        try {
            out << data.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
        } catch (const nlohmann::json::exception& ex) {
            throw std::runtime_error("Failed to serialize '" + path.string() + "': " + ex.what());
        }
        out.flush();
        if (!out.good()) {
            throw std::runtime_error("Failed while writing '" + tmp_path.string() + "'.");
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw std::runtime_error("rename('" + tmp_path.string() + "' -> '" + path.string() + "') failed: " + reason);
    }
}

}
