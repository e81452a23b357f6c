#pragma once

#include <expected>
#include <stop_token>
#include <string>

// Fetches and unpacks a recognition model archive on first use.
//
// Layout: the archive is downloaded next to the target directory as
// <dir>.zip, extracted into <dir>.partial, and the model folder inside it
// is renamed onto <dir>. A crash mid-way leaves only the .zip/.partial
// leftovers, which the next ensure() overwrites.
class ModelStore {
public:
    ModelStore(std::string model_dir, std::string name, std::string url);
    ~ModelStore();

    ModelStore(const ModelStore&) = delete;
    ModelStore& operator=(const ModelStore&) = delete;

    bool is_provisioned() const;

    // Returns the model directory, downloading it first if needed.
    std::expected<std::string, std::string> ensure(std::stop_token stop = {});

    const std::string& model_dir() const { return model_dir_; }

private:
    std::expected<void, std::string> download(const std::string& dest, std::stop_token stop);
    std::expected<void, std::string> unpack(const std::string& archive,
                                            const std::string& staging);
    std::expected<void, std::string> install(const std::string& staging);

    std::string model_dir_;
    std::string name_;
    std::string url_;
};
