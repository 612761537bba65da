#include "UploadClient.hpp"

#include "JsonLib.hpp"
#include "UrlUtils.hpp"
#include "httplib.h"

namespace wt {
string UploadClient::uploadPath(const TargetRef& target, const string& fileName,
                                const string& userIdentity) {
  return "/upload/" + UrlUtils::encode(target.ns()) + "/" +
         UrlUtils::encode(target.name()) +
         "?filename=" + UrlUtils::encode(fileName) +
         "&chinesename=" + UrlUtils::encode(userIdentity);
}

UploadResponse UploadClient::parseResponse(int status, const string& body) {
  UploadResponse response;
  response.set_status_code(status);
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    if (status != 200) {
      response.set_error("Server answered " + to_string(status) +
                         (body.empty() ? "" : ": " + body));
    }
    return response;
  }
  if (parsed.contains("message") && parsed["message"].is_string()) {
    response.set_message(parsed["message"].get<string>());
  }
  if (parsed.contains("path") && parsed["path"].is_string()) {
    response.set_path(parsed["path"].get<string>());
  } else if (status == 200) {
    // The destination path travels in "message"
    response.set_path(response.message());
  }
  if (parsed.contains("error") && parsed["error"].is_string()) {
    response.set_error(parsed["error"].get<string>());
  } else if (status != 200) {
    response.set_error("Server answered " + to_string(status));
  }
  return response;
}

UploadResponse UploadClient::upload(const TargetRef& target,
                                    const string& localPath,
                                    ProgressFn progress) {
  std::error_code ec;
  auto fileSize = fs::file_size(localPath, ec);
  if (ec || !fs::is_regular_file(localPath)) {
    throw UploadValidationFailed("Cannot read " + localPath);
  }
  auto file = make_shared<std::ifstream>(localPath,
                                         std::ios::in | std::ios::binary);
  if (!file->is_open()) {
    throw UploadValidationFailed("Cannot open " + localPath);
  }
  string fileName = fs::path(localPath).filename().string();
  int64_t total = int64_t(fileSize);

  httplib::Client client(serverEndpoint.name(), serverEndpoint.port());
  client.set_connection_timeout(10);
  client.set_read_timeout(600);
  client.set_write_timeout(60);

  LOG(INFO) << "Uploading " << localPath << " (" << total << " bytes) to "
            << target;
  auto result = client.Post(
      uploadPath(target, fileName, userIdentity), size_t(total),
      [file, progress, total](size_t offset, size_t length,
                              httplib::DataSink& sink) {
        char buf[4096];
        size_t n = min(length, sizeof(buf));
        file->seekg(std::streamoff(offset));
        file->read(buf, std::streamsize(n));
        std::streamsize got = file->gcount();
        if (got <= 0) {
          return false;
        }
        if (!sink.write(buf, size_t(got))) {
          return false;
        }
        if (progress) {
          progress(int64_t(offset) + got, total);
        }
        return true;
      },
      "application/octet-stream");
  if (!result) {
    throw UploadTransportFailed("Could not reach wtserver: " +
                                httplib::to_string(result.error()));
  }
  return parseResponse(result->status, result->body);
}
}  // namespace wt
