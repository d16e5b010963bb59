#include "static_files.hpp"
#include "util.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <system_error>
#include <tuple>
#include <vector>

namespace skill
{
    namespace fs = std::filesystem;

    namespace
    {
        std::string strip_query(const std::string &target)
        {
            auto cut = target.find_first_of("?#");
            return cut == std::string::npos ? target : target.substr(0, cut);
        }

        std::time_t to_time_t(fs::file_time_type ft)
        {
            auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                ft - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
            return std::chrono::system_clock::to_time_t(sctp);
        }

        void finish_head(const http_request &req, http_response &res)
        {
            if (req.method() == http::verb::head)
            {
                auto size = res.body().size();
                res.body().clear();
                res.content_length(size);
            }
        }
    }

    std::string guess_content_type(const fs::path &file)
    {
        static const std::map<std::string, std::string> types = {
            {".html", "text/html"},
            {".htm", "text/html"},
            {".css", "text/css"},
            {".js", "text/javascript"},
            {".mjs", "text/javascript"},
            {".json", "application/json"},
            {".txt", "text/plain"},
            {".md", "text/markdown"},
            {".csv", "text/csv"},
            {".xml", "text/xml"},
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},
            {".svg", "image/svg+xml"},
            {".ico", "image/vnd.microsoft.icon"},
            {".webp", "image/webp"},
            {".pdf", "application/pdf"},
            {".zip", "application/zip"},
            {".gz", "application/gzip"},
            {".wasm", "application/wasm"},
            {".py", "text/x-python"},
            {".sh", "application/x-sh"},
        };
        auto it = types.find(to_lower(file.extension().string()));
        return it == types.end() ? "application/octet-stream" : it->second;
    }

    http_response error_page(const http_request &req, http::status status, const std::string &message)
    {
        std::string code = std::to_string(static_cast<unsigned>(status));
        std::string body =
            "<!DOCTYPE HTML>\n<html lang=\"en\">\n    <head>\n        <meta charset=\"utf-8\">\n"
            "        <title>Error response</title>\n    </head>\n    <body>\n"
            "        <h1>Error response</h1>\n"
            "        <p>Error code: " + code + "</p>\n"
            "        <p>Message: " + html_escape(message) + ".</p>\n"
            "    </body>\n</html>\n";
        http_response res = make_response(req, status, "text/html;charset=utf-8", std::move(body));
        res.keep_alive(false);
        finish_head(req, res);
        return res;
    }

    static_files::static_files(fs::path root)
        : root_(std::move(root))
    {
    }

    fs::path static_files::translate(const std::string &target) const
    {
        std::string path = percent_decode(strip_query(target));
        bool trailing_slash = !path.empty() && path.back() == '/';
        fs::path out = root_;
        std::stringstream ss(path);
        std::string segment;
        while (std::getline(ss, segment, '/'))
        {
            if (segment.empty() || segment == "." || segment == "..")
                continue;
            out /= segment;
        }
        if (trailing_slash)
            out /= "";
        return out;
    }

    any_response static_files::operator()(const http_request &req) const
    {
        if (req.method() != http::verb::get && req.method() != http::verb::head)
            return error_page(req, http::status::not_implemented,
                              "Unsupported method ('" + std::string(req.method_string()) + "')");

        std::string target(req.target());
        std::string url_path = strip_query(target);
        fs::path path = translate(target);
        std::error_code ec;

        if (fs::is_directory(path, ec))
        {
            if (url_path.empty() || url_path.back() != '/')
            {
                std::string location = url_path + "/";
                auto q = target.find('?');
                if (q != std::string::npos)
                    location += target.substr(q);
                http_response res = make_response(req, http::status::moved_permanently, "text/html", "");
                res.set(http::field::location, location);
                res.keep_alive(false);
                return res;
            }
            for (const char *index : {"index.html", "index.htm"})
            {
                fs::path candidate = path / index;
                if (fs::is_regular_file(candidate, ec))
                    return serve_file(req, candidate);
            }
            return list_directory(req, path, url_path);
        }

        // "file/" names a directory that is not there.
        if (!url_path.empty() && url_path.back() == '/')
            return error_page(req, http::status::not_found, "File not found");
        return serve_file(req, path);
    }

    any_response static_files::serve_file(const http_request &req, const fs::path &file) const
    {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec))
            return error_page(req, http::status::not_found, "File not found");

        http::file_body::value_type body;
        boost::beast::error_code open_ec;
        body.open(file.c_str(), boost::beast::file_mode::scan, open_ec);
        if (open_ec)
            return error_page(req, http::status::not_found, "File not found");

        std::time_t modified = 0;
        auto ft = fs::last_write_time(file, ec);
        if (!ec)
            modified = to_time_t(ft);

        auto ims = req.find(http::field::if_modified_since);
        if (ims != req.end() && req.find(http::field::if_none_match) == req.end() && !ec)
        {
            if (auto since = parse_http_date(std::string(ims->value())); since && modified <= *since)
            {
                http_response res{http::status::not_modified, req.version()};
                res.set(http::field::server, "skill-backend");
                res.keep_alive(false);
                return res;
            }
        }

        auto size = body.size();
        if (req.method() == http::verb::head)
        {
            http_response res{http::status::ok, req.version()};
            res.set(http::field::server, "skill-backend");
            res.set(http::field::content_type, guess_content_type(file));
            if (!ec)
                res.set(http::field::last_modified, http_date(modified));
            res.content_length(size);
            res.keep_alive(false);
            return res;
        }

        file_response res{std::piecewise_construct, std::make_tuple(std::move(body)),
                          std::make_tuple(http::status::ok, req.version())};
        res.set(http::field::server, "skill-backend");
        res.set(http::field::content_type, guess_content_type(file));
        if (!ec)
            res.set(http::field::last_modified, http_date(modified));
        res.content_length(size);
        res.keep_alive(false);
        return std::move(res);
    }

    http_response static_files::list_directory(const http_request &req, const fs::path &dir,
                                                const std::string &url_path) const
    {
        struct entry
        {
            std::string name;
            std::string display;
            std::string link;
        };
        std::vector<entry> entries;
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec)
            return error_page(req, http::status::not_found, "No permission to list directory");
        for (; it != fs::directory_iterator(); it.increment(ec))
        {
            if (ec)
                return error_page(req, http::status::not_found, "No permission to list directory");
            std::string name = it->path().filename().string();
            entry e{name, name, name};
            std::error_code sec;
            // is_directory follows links: a link to a directory gets "name/"
            // as its href but is shown as "name@".
            if (it->is_directory(sec))
            {
                e.display += "/";
                e.link += "/";
            }
            if (it->is_symlink(sec))
                e.display = name + "@";
            entries.push_back(std::move(e));
        }
        std::sort(entries.begin(), entries.end(), [](const entry &a, const entry &b)
                  { return to_lower(a.name) < to_lower(b.name); });

        std::string title = "Directory listing for " + html_escape(percent_decode(url_path));
        std::string body = "<!DOCTYPE HTML>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n<title>" +
                           title + "</title>\n</head>\n<body>\n<h1>" + title + "</h1>\n<hr>\n<ul>\n";
        for (const auto &e : entries)
        {
            body += "<li><a href=\"" + percent_encode_path(e.link) + "\">" + html_escape(e.display) + "</a></li>\n";
        }
        body += "</ul>\n<hr>\n</body>\n</html>\n";

        http_response res = make_response(req, http::status::ok, "text/html; charset=utf-8", std::move(body));
        res.keep_alive(false);
        finish_head(req, res);
        return res;
    }
}
