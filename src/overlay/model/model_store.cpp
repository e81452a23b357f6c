#include "model_store.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <filesystem>
#include <print>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

size_t write_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* f = static_cast<FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, f) * size;
}

int check_cancel(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                 curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

} // namespace

ModelStore::ModelStore(std::string model_dir, std::string name, std::string url)
    : model_dir_(std::move(model_dir)), name_(std::move(name)), url_(std::move(url)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ModelStore::~ModelStore() {
    curl_global_cleanup();
}

bool ModelStore::is_provisioned() const {
    std::error_code ec;
    return fs::is_directory(model_dir_, ec) && !fs::is_empty(model_dir_, ec);
}

std::expected<std::string, std::string> ModelStore::ensure(std::stop_token stop) {
    if (is_provisioned()) return model_dir_;

    if (url_.empty()) {
        return std::unexpected("model not found at " + model_dir_ + " and no download url set");
    }

    fs::path target(model_dir_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return std::unexpected("cannot create " + target.parent_path().string() + ": " +
                                   ec.message());
        }
    }

    std::string archive = model_dir_ + ".zip";
    std::string staging = model_dir_ + ".partial";

    std::println(stderr, "model: downloading {} from {}", name_, url_);
    if (auto r = download(archive, stop); !r) {
        fs::remove(archive, ec);
        return std::unexpected(r.error());
    }

    std::println(stderr, "model: extracting {}", archive);
    fs::remove_all(staging, ec);
    auto r = unpack(archive, staging);
    if (r) r = install(staging);

    fs::remove(archive, ec);
    fs::remove_all(staging, ec);
    if (!r) return std::unexpected(r.error());

    std::println(stderr, "model: installed at {}", model_dir_);
    return model_dir_;
}

std::expected<void, std::string> ModelStore::download(const std::string& dest,
                                                      std::stop_token stop) {
    FILE* out = std::fopen(dest.c_str(), "wb");
    if (!out) {
        return std::unexpected("cannot write " + dest + ": " + std::strerror(errno));
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(out);
        return std::unexpected("curl_easy_init failed");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, check_cancel);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    bool flushed = std::fclose(out) == 0;

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("model download cancelled");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("model download failed: ") + curl_easy_strerror(res));
    }
    if (!flushed) {
        return std::unexpected("cannot write " + dest);
    }
    return {};
}

std::expected<void, std::string> ModelStore::unpack(const std::string& archive,
                                                    const std::string& staging) {
    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::execlp("unzip", "unzip", "-q", "-o", archive.c_str(), "-d", staging.c_str(), nullptr);
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (!WIFEXITED(status)) {
        return std::unexpected("unzip terminated abnormally");
    }
    if (WEXITSTATUS(status) == 127) {
        return std::unexpected("unzip not found");
    }
    if (WEXITSTATUS(status) != 0) {
        return std::unexpected("unzip exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    return {};
}

std::expected<void, std::string> ModelStore::install(const std::string& staging) {
    // Archives normally hold a single top-level folder named after the model.
    fs::path source = fs::path(staging) / name_;
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        fs::path only;
        int dirs = 0;
        int others = 0;
        for (const auto& entry : fs::directory_iterator(staging, ec)) {
            if (entry.is_directory()) { only = entry.path(); ++dirs; }
            else ++others;
        }
        if (dirs == 1 && others == 0) source = only;
        else if (dirs + others > 0) source = staging;
        else return std::unexpected("model archive is empty");
    }

    fs::remove_all(model_dir_, ec);
    fs::rename(source, model_dir_, ec);
    if (ec) {
        return std::unexpected("cannot move model into " + model_dir_ + ": " + ec.message());
    }
    return {};
}
