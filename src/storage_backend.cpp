// src/storage_backend.cpp
#include "storage_backend.hpp"
#include "errors.hpp"

#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace ChunkStore
{
    namespace Storage
    {

        DirectoryBackend::DirectoryBackend(fs::path root) : root_(std::move(root))
        {
            std::error_code ec;
            fs::create_directories(root_, ec);
            if (ec && !fs::is_directory(root_))
            {
                throw BackendError("cannot create storage root " + root_.string() + ": " + ec.message(), false);
            }
        }

        fs::path DirectoryBackend::resolve(const std::string &relative) const
        {
            // Dropbox-style paths start with '/'; they are still relative to the account root.
            std::string trimmed = relative;
            while (!trimmed.empty() && trimmed.front() == '/')
            {
                trimmed.erase(trimmed.begin());
            }
            if (trimmed.empty())
            {
                throw BackendError("empty remote path", false);
            }

            fs::path rel = fs::path(trimmed).lexically_normal();
            if (rel.is_absolute() || (!rel.empty() && *rel.begin() == ".."))
            {
                throw BackendError("remote path escapes the storage root: " + relative, false);
            }
            return root_ / rel;
        }

        std::string DirectoryBackend::upload(const std::vector<char> &bytes, const std::string &remote_path)
        {
            fs::path target = resolve(remote_path);

            std::error_code ec;
            fs::create_directories(target.parent_path(), ec);
            if (ec)
            {
                throw BackendError("cannot create folder " + target.parent_path().string() + ": " + ec.message(), true);
            }

            fs::path tmp = target;
            tmp += ".uploading." + std::to_string(upload_counter_.fetch_add(1));
            {
                std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw BackendError("cannot open " + tmp.string() + " for writing", true);
                }
                ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
                if (!ofs.good())
                {
                    throw BackendError("short write to " + tmp.string(), true);
                }
            }

            fs::rename(tmp, target, ec);
            if (ec)
            {
                std::string reason = ec.message();
                fs::remove(tmp, ec);
                throw BackendError("cannot move upload into place at " + target.string() + ": " + reason, true);
            }
            return target.lexically_relative(root_).generic_string();
        }

        std::vector<char> DirectoryBackend::download(const std::string &remote_id)
        {
            fs::path source = resolve(remote_id);

            std::ifstream ifs(source, std::ios::binary);
            if (!ifs.is_open())
            {
                throw BackendError("object not found: " + remote_id, false);
            }
            std::vector<char> data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
            if (ifs.bad())
            {
                throw BackendError("read failed for " + remote_id, true);
            }
            return data;
        }

        std::string DirectoryBackend::findByName(const std::string &name)
        {
            std::error_code ec;
            fs::recursive_directory_iterator it(root_, ec);
            if (ec)
            {
                throw BackendError("cannot list storage root " + root_.string() + ": " + ec.message(), true);
            }
            for (const auto &entry : it)
            {
                if (entry.is_regular_file() && entry.path().filename() == name)
                {
                    return entry.path().lexically_relative(root_).generic_string();
                }
            }
            throw BackendError("no object named " + name, false);
        }

    } // namespace Storage
} // namespace ChunkStore
