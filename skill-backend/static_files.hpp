#pragma once

#include "http_server.hpp"

#include <filesystem>
#include <string>

namespace skill
{
    // Directory server: files, index pages and listings under root, GET and
    // HEAD only. Every response closes the connection.
    class static_files
    {
    public:
        explicit static_files(std::filesystem::path root);

        // File contents are streamed with file_body; everything else,
        // including HEAD for a file, is a string response.
        any_response operator()(const http_request &req) const;

        // URL path to a filesystem path under root. ".", ".." and empty
        // segments are dropped; a trailing slash is kept.
        std::filesystem::path translate(const std::string &target) const;

    private:
        any_response serve_file(const http_request &req, const std::filesystem::path &file) const;
        http_response list_directory(const http_request &req, const std::filesystem::path &dir,
                                     const std::string &url_path) const;

        std::filesystem::path root_;
    };

    std::string guess_content_type(const std::filesystem::path &file);

    http_response error_page(const http_request &req, http::status status, const std::string &message);
}
