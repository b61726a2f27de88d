// main.cpp
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <memory>
#include <optional>
#include <atomic>

// Crow includes
#include <crow.h>
#include <crow/multipart.h> // For multipart/form-data parsing

#include <nlohmann/json.hpp>

// Our project includes
#include "errors.hpp"
#include "service_config.hpp"
#include "store_service.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* const PASSWORD_HEADER = "X-Chunk-Password";

std::atomic<uint64_t> request_counter{0};

crow::response errorResponse(const std::string& action, const std::exception& e) {
    std::cerr << "Error during " << action << ": " << e.what() << std::endl;
    json body = {{"error", e.what()}};
    crow::response res(ChunkStore::httpStatusFor(e), body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

crow::response jsonResponse(int code, const json& body) {
    crow::response res(code, body.dump(4));
    res.set_header("Content-Type", "application/json");
    return res;
}

bool flagSet(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

std::optional<std::string> passwordFrom(const crow::request& req) {
    std::string password = req.get_header_value(PASSWORD_HEADER);
    if (password.empty()) {
        return std::nullopt;
    }
    return password;
}

json failuresToJson(const std::vector<ChunkStore::Transfer::ReplicaFailure>& failures) {
    json out = json::array();
    for (const auto& f : failures) {
        out.push_back({{"index", f.chunk_index},
                       {"chunk_id", f.chunk_id},
                       {"provider", ChunkStore::Distribution::providerToString(f.target.provider)},
                       {"account", f.target.account},
                       {"reason", f.reason}});
    }
    return out;
}

json reportToJson(const ChunkStore::Transfer::UploadReport& report) {
    return {{"replicas_uploaded", report.replicas_uploaded},
            {"replicas_already_present", report.replicas_already_present},
            {"chunks_kept_local", report.chunks_kept_local},
            {"chunks_not_attempted", report.chunks_not_attempted},
            {"cancelled", report.cancelled},
            {"failures", failuresToJson(report.failures)}};
}

json reportToJson(const ChunkStore::Transfer::DownloadReport& report) {
    return {{"chunks_downloaded", report.chunks_downloaded},
            {"chunks_not_attempted", report.chunks_not_attempted},
            {"cancelled", report.cancelled},
            {"failed_attempts", failuresToJson(report.failed_attempts)}};
}

// Unique scratch path in the system temp directory.
fs::path scratchPath(const std::string& prefix) {
    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
    return fs::temp_directory_path() /
           (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(request_counter.fetch_add(1)));
}

std::optional<std::vector<char>> readWholeFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    return std::vector<char>((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

} // namespace

int main(int argc, char* argv[]) {
    const fs::path config_path = argc > 1 ? fs::path(argv[1]) : fs::path("config.json");

    std::shared_ptr<ChunkStore::StoreService> store;
    try {
        ChunkStore::Config::ServiceConfig config = ChunkStore::Config::ServiceConfig::load(config_path);
        store = std::make_shared<ChunkStore::StoreService>(std::move(config));
    } catch (const std::exception& e) {
        std::cerr << "Failed to start: " << e.what() << std::endl;
        return 1;
    }

    crow::SimpleApp app;

    // --- POST /files: split a new file, optionally encrypt and upload it ---
    // Expects multipart/form-data with fields:
    // - file: the actual file content
    // - filename: (optional) original filename, if not provided in multipart-data
    // - encrypt: (optional) "true" to encrypt with the X-Chunk-Password header
    // - cloud: (optional) "true" to upload the chunks right away
    CROW_ROUTE(app, "/files").methods("POST"_method)
    ([store](const crow::request& req) {
        if (req.get_header_value("Content-Type").rfind("multipart/form-data", 0) != 0) {
            return crow::response(400, "Bad Request: Expected multipart/form-data.");
        }

        crow::multipart::message multipart_data(req);
        auto file_it = multipart_data.part_map.find("file");
        if (file_it == multipart_data.part_map.end()) {
            return crow::response(400, "Bad Request: 'file' part missing in multipart/form-data.");
        }
        const crow::multipart::part& file_part = file_it->second;

        auto field = [&](const std::string& name) {
            auto it = multipart_data.part_map.find(name);
            return it == multipart_data.part_map.end() ? std::string() : it->second.body;
        };

        // Filename: form field first, then the part's Content-Disposition.
        std::string filename_to_use = field("filename");
        if (filename_to_use.empty()) {
            auto disposition = file_part.get_header_object("Content-Disposition");
            auto fn = disposition.params.find("filename");
            if (fn != disposition.params.end()) {
                filename_to_use = fn->second;
            }
        }
        if (filename_to_use.empty()) {
            return crow::response(400, "Bad Request: no filename given.");
        }

        const bool encrypt = flagSet(field("encrypt"));
        const bool cloud = flagSet(field("cloud"));
        std::optional<std::string> password = passwordFrom(req);
        if (encrypt && !password) {
            return crow::response(400, std::string("Bad Request: encryption requires the ") + PASSWORD_HEADER +
                                           " header.");
        }
        if (!encrypt) {
            password.reset();
        }

        fs::path temp_filepath = scratchPath("chunkstore_in");
        {
            std::ofstream temp_ofs(temp_filepath, std::ios::binary);
            if (!temp_ofs.is_open()) {
                return crow::response(500, "Internal Server Error: Could not create temporary file.");
            }
            temp_ofs.write(file_part.body.data(), static_cast<std::streamsize>(file_part.body.size()));
        }

        try {
            ChunkStore::Metadata::Manifest manifest = store->splitFile(temp_filepath.string(), filename_to_use, password);
            std::error_code ec;
            fs::remove(temp_filepath, ec);

            json body = json::parse(manifest.serialize());
            if (cloud) {
                ChunkStore::Transfer::UploadReport report = store->uploadFile(filename_to_use);
                body = {{"manifest", json::parse(store->readManifest(filename_to_use).serialize())},
                        {"upload", reportToJson(report)}};
            }
            return jsonResponse(201, body);
        } catch (const std::exception& e) {
            std::error_code ec;
            fs::remove(temp_filepath, ec);
            return errorResponse("file split", e);
        }
    });

    // --- POST /files/<name>/upload: push local chunks to the configured destinations ---
    CROW_ROUTE(app, "/files/<string>/upload").methods("POST"_method)
    ([store](const crow::request&, std::string name) {
        try {
            return jsonResponse(200, reportToJson(store->uploadFile(name)));
        } catch (const std::exception& e) {
            return errorResponse("upload", e);
        }
    });

    // --- POST /files/<name>/download: fetch chunks back into local storage ---
    CROW_ROUTE(app, "/files/<string>/download").methods("POST"_method)
    ([store](const crow::request&, std::string name) {
        try {
            return jsonResponse(200, reportToJson(store->downloadFile(name)));
        } catch (const std::exception& e) {
            return errorResponse("download", e);
        }
    });

    // --- GET /files/<name>: reassemble a file ---
    CROW_ROUTE(app, "/files/<string>").methods("GET"_method)
    ([store](const crow::request& req, std::string name) {
        fs::path temp_output_path = scratchPath("chunkstore_out");
        try {
            const char* cloud = req.url_params.get("cloud");
            if (cloud != nullptr && flagSet(cloud)) {
                store->downloadFile(name);
            }
            store->assembleFile(name, temp_output_path.string(), passwordFrom(req));

            auto buffer = readWholeFile(temp_output_path);
            std::error_code ec;
            fs::remove(temp_output_path, ec);
            if (!buffer) {
                return crow::response(500, "Internal Server Error: Could not open assembled file.");
            }

            crow::response res(200);
            res.set_header("Content-Type", "application/octet-stream");
            res.set_header("Content-Disposition", "attachment; filename=\"" + name + "\"");
            res.write(std::string(buffer->begin(), buffer->end()));
            return res;
        } catch (const std::exception& e) {
            std::error_code ec;
            fs::remove(temp_output_path, ec);
            return errorResponse("assembly", e);
        }
    });

    // --- GET /manifests/<name>: manifest document ---
    CROW_ROUTE(app, "/manifests/<string>")
    ([store](std::string name) {
        try {
            crow::response res(200, store->readManifest(name).serialize());
            res.set_header("Content-Type", "application/json");
            return res;
        } catch (const std::exception& e) {
            return errorResponse("manifest lookup", e);
        }
    });

    // --- GET /chunks/<name>/<id>: stored bytes of one chunk ---
    CROW_ROUTE(app, "/chunks/<string>/<string>")
    ([store](std::string name, std::string chunk_id) {
        try {
            std::vector<char> chunk_data = store->retrieveChunk(name, chunk_id);

            crow::response res(200);
            res.set_header("Content-Type", "application/octet-stream");
            res.set_header("Content-Disposition", "attachment; filename=\"" + chunk_id + ".chunk\"");
            res.write(std::string(chunk_data.begin(), chunk_data.end()));
            return res;
        } catch (const std::exception& e) {
            return errorResponse("chunk retrieval", e);
        }
    });

    // --- DELETE /files/<name>/chunks: remove local chunk files ---
    CROW_ROUTE(app, "/files/<string>/chunks").methods("DELETE"_method)
    ([store](const crow::request&, std::string name) {
        try {
            size_t removed = store->cleanupLocalChunks(name);
            return jsonResponse(200, json{{"removed", removed}});
        } catch (const std::exception& e) {
            return errorResponse("chunk cleanup", e);
        }
    });

    const uint16_t port = store->config().server.port;
    std::cout << "Starting chunk store service on http://localhost:" << port << std::endl;
    app.port(port).multithreaded().run();

    return 0;
}
