#include <seanet/source.hpp>
#include <seanet/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace seanet {

Result<SourceFile> SourceFile::load(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return SeanetError{SeanetError::NotFound,
            "source file does not exist: " + path,
            "double-check the path and try again"};
    }
    if (fs::is_directory(path, ec)) {
        return SeanetError{SeanetError::IO,
            "source path is a directory: " + path};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return SeanetError{SeanetError::IO,
            "could not open source file: " + path,
            "check file permissions"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return SeanetError{SeanetError::IO,
            "failed while reading source file: " + path};
    }

    SourceFile file(path, buf.str());
    log::debug("loaded %s (%zu bytes)", path.c_str(), file.text.size());
    return Result<SourceFile>::ok(std::move(file));
}

} // namespace seanet
