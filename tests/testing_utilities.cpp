#include "testing_utilities.h"

#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/utils/filesystem.h>
#include <zlib.h>

#include <cstdio>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace routelog_test {
bool write_gzip_file(const std::string &path, const std::string &content) {
    gzFile gz_output = gzopen(path.c_str(), "wb");
    if (!gz_output) {
        return false;
    }
    if (!content.empty() &&
        gzwrite(gz_output, content.data(),
                static_cast<unsigned int>(content.size())) !=
            static_cast<int>(content.size())) {
        gzclose(gz_output);
        return false;
    }
    return gzclose(gz_output) == Z_OK;
}

std::string gzip_string(const std::string &content) {
    z_stream stream{};
    // 15 window bits + 16 selects the gzip wrapper
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return "";
    }
    std::string out(deflateBound(&stream, content.size()) + 32, '\0');
    stream.next_in =
        reinterpret_cast<Bytef *>(const_cast<char *>(content.data()));
    stream.avail_in = static_cast<uInt>(content.size());
    stream.next_out = reinterpret_cast<Bytef *>(&out[0]);
    stream.avail_out = static_cast<uInt>(out.size());
    int ret = deflate(&stream, Z_FINISH);
    out.resize(stream.total_out);
    deflateEnd(&stream);
    return ret == Z_STREAM_END ? out : "";
}

std::string make_segment_lines(std::size_t segment, std::size_t records) {
    std::string out;
    for (std::size_t i = 0; i < records; ++i) {
        std::string which;
        if (i == 0) {
            which = "initData";
        } else if (i == 1) {
            which = "carParams";
        } else {
            which = i % 2 == 0 ? "carState" : "can";
        }
        std::uint64_t mono = segment * 1000 + (records - i);
        out += "{\"which\":\"" + which + "\",\"logMonoTime\":" +
               std::to_string(mono) + ",\"segment\":" +
               std::to_string(segment) + ",\"index\":" + std::to_string(i);
        if (which == "carParams") {
            out += ",\"carParams\":{\"carFingerprint\":\"SUBARU OUTBACK 6TH "
                   "GEN\"}";
        }
        out += "}\n";
    }
    return out;
}

std::vector<std::int64_t> range(std::int64_t begin, std::int64_t end,
                                std::int64_t step) {
    std::vector<std::int64_t> out;
    for (std::int64_t i = begin; i < end; i += step) out.push_back(i);
    return out;
}

TestEnvironment::TestEnvironment() {
    ROUTELOG_LOGGER_INIT();
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(100000, 999999);

    fs::path temp_base = fs::temp_directory_path();
    fs::path test_path =
        temp_base / ("routelog_test_" + std::to_string(dis(gen)));

    std::error_code ec;
    if (fs::create_directories(test_path, ec)) {
        test_dir = test_path.string();
    }
}

TestEnvironment::~TestEnvironment() {
    if (!test_dir.empty()) {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }
}

const std::string &TestEnvironment::get_dir() const { return test_dir; }
bool TestEnvironment::is_valid() const { return !test_dir.empty(); }

std::string TestEnvironment::create_segment_file(std::size_t segment,
                                                 const std::string &variant,
                                                 std::size_t records) {
    if (test_dir.empty()) {
        return "";
    }
    fs::path dir = fs::path(test_dir) / TEST_DONGLE / TEST_NAME /
                   std::to_string(segment);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return "";
    }
    std::string path = (dir / (variant + ".gz")).string();
    if (!write_gzip_file(path, make_segment_lines(segment, records))) {
        return "";
    }
    return path;
}

std::string TestEnvironment::create_file(const std::string &name,
                                         const std::string &content) {
    if (test_dir.empty()) {
        return "";
    }
    std::string path = (fs::path(test_dir) / name).string();
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }
    file << content;
    return path;
}

std::vector<routelog::SegmentFiles> TestEnvironment::create_route_files(
    std::size_t count, const std::vector<std::size_t> &full) {
    std::vector<routelog::SegmentFiles> files(count);
    for (std::size_t segment = 0; segment < count; ++segment) {
        files[segment].quick_log =
            create_segment_file(segment, "qlog", QUICK_RECORDS);
    }
    for (std::size_t segment : full) {
        if (segment < count) {
            files[segment].full_log =
                create_segment_file(segment, "rlog", FULL_RECORDS);
        }
    }
    return files;
}

FakeBackend::FakeBackend(std::int64_t segment_count,
                         std::vector<routelog::SegmentFiles> files)
    : segment_count_(segment_count), files_(std::move(files)) {}

std::int64_t FakeBackend::max_segment_count(
    const routelog::Route &route) const {
    ++count_calls_;
    if (fail) {
        throw routelog::ResolutionError("lookup failed for " +
                                        route.to_string());
    }
    return segment_count_;
}

std::vector<routelog::SegmentFiles> FakeBackend::segment_files(
    const routelog::Route &route) const {
    ++files_calls_;
    if (fail) {
        throw routelog::ResolutionError("lookup failed for " +
                                        route.to_string());
    }
    return files_;
}

void FakeHttpClient::set(const std::string &url, long status,
                         std::string body) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[url] = routelog::HttpResponse{status, std::move(body)};
    broken_.erase(url);
}

void FakeHttpClient::set_transport_error(const std::string &url) {
    std::lock_guard<std::mutex> lock(mutex_);
    broken_[url] = true;
}

routelog::HttpResponse FakeHttpClient::get(const std::string &url,
                                           std::chrono::seconds) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ++requests_[url];
    if (broken_.count(url)) {
        throw routelog::FetchError("connection reset for " + url);
    }
    auto it = responses_.find(url);
    if (it == responses_.end()) {
        return routelog::HttpResponse{404, ""};
    }
    return it->second;
}

long FakeHttpClient::head(const std::string &url,
                          std::chrono::seconds timeout) const {
    return get(url, timeout).status;
}

std::string FakeHttpClient::encode(const std::string &str) const {
    std::string out;
    for (char c : str) {
        if (c == '|') {
            out += "%7C";
        } else {
            out += c;
        }
    }
    return out;
}

std::size_t FakeHttpClient::requests(const std::string &url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(url);
    return it == requests_.end() ? 0 : it->second;
}

std::size_t FakeHttpClient::total_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto &entry : requests_) total += entry.second;
    return total;
}

routelog::ReaderOptions make_options(std::shared_ptr<FakeBackend> backend,
                                     std::shared_ptr<FakeHttpClient> http) {
    routelog::ReaderOptions options;
    options.backend = std::move(backend);
    options.http = http ? std::move(http) : std::make_shared<FakeHttpClient>();
    options.retry = std::make_shared<routelog::NoRetry>();
    options.config.cache_enabled = false;
    return options;
}

}  // namespace routelog_test
