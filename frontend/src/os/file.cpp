// frontend/src/os/file.cpp
#include <specdoc/os/File.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

#if defined(_WIN32)
    #include <windows.h>
    #include <fileapi.h>
#else
    // POSIX (Linux, macOS)
    #include <cerrno>   // errno
    #include <cstring>  // std::strerror
    #include <cstdlib>  // realpath
    #include <limits.h> // PATH_MAX

    #ifndef PATH_MAX
        #define PATH_MAX 4096
    #endif
#endif

namespace specdoc {

    bool open_file(const std::string& path, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.clear();

        std::FILE* fp = std::fopen(path.c_str(), "rb");
        if (!fp) {
        #if defined(_WIN32)
            out_error = "CANNOT open file.";
        #else
            out_error = std::string("CANNOT open file: ") + std::strerror(errno);
        #endif
            return false;
        }

        std::fseek(fp, 0, SEEK_END);
        long sz = std::ftell(fp);
        std::fseek(fp, 0, SEEK_SET);

        if (sz < 0) {
            std::fclose(fp);
            out_error = "파일 크기를 읽을 수 없습니다.";
            return false;
        }

        out_content.resize(static_cast<size_t>(sz));
        size_t n = std::fread(out_content.data(), 1, out_content.size(), fp);
        std::fclose(fp);

        if (n != out_content.size()) {
            out_error = "파일 읽기 중 일부만 읽혔습니다.";
            return false;
        }

        // \r\n 도 원문 그대로 둔다 (printer 가 바이트 단위로 재현해야 함)
        return true;
    }

    bool write_file(const std::string& path, std::string_view content, std::string& out_error) {
        out_error.clear();
        if (path.empty()) {
            out_error = "empty output path";
            return false;
        }

        const std::filesystem::path target(path);
        std::error_code ec{};
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
            if (ec) {
                out_error = "failed to create directory: " + target.parent_path().string();
                return false;
            }
        }

        const std::filesystem::path tmp = path + ".tmp";
        {
            std::ofstream ofs(tmp, std::ios::binary);
            if (!ofs) {
                out_error = "failed to open temporary file for write: " + tmp.string();
                return false;
            }
            ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
            if (!ofs.good()) {
                out_error = "failed to write temporary file: " + tmp.string();
                return false;
            }
        }

        std::filesystem::rename(tmp, target, ec);
        if (ec) {
            std::filesystem::remove(target, ec);
            ec.clear();
            std::filesystem::rename(tmp, target, ec);
        }
        if (ec) {
            std::filesystem::remove(tmp, ec);
            out_error = "failed to move temporary file to final path: " + path;
            return false;
        }
        return true;
    }

    std::string normalize_path(const std::string& path) {
    #if defined(_WIN32)
        char buf[MAX_PATH];
        DWORD n = GetFullPathNameA(path.c_str(), MAX_PATH, buf, nullptr);
        if (n == 0 || n >= MAX_PATH) return path;
        return std::string(buf);
    #else
        // realpath 는 존재하지 않는 경로면 실패한다
        char buf[PATH_MAX];
        if (::realpath(path.c_str(), buf) != nullptr) {
            return std::string(buf);
        }
        return path;
    #endif
    }

} // namespace specdoc
