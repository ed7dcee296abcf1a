#include <voxturn/transport/http_client.hpp>

#include <mutex>

#include <curl/curl.h>

namespace voxturn {

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = reinterpret_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

static void global_init_once() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

StatusCode statusFromHttpReply(long http_status) {
  if (http_status >= 200 && http_status < 300) return StatusCode::Ok;
  switch (http_status) {
    case 400: return StatusCode::InvalidArgument;
    case 401: return StatusCode::Unauthenticated;
    case 403: return StatusCode::PermissionDenied;
    case 408:
    case 504: return StatusCode::DeadlineExceeded;
    case 429:
    case 502:
    case 503: return StatusCode::Unavailable;
    default:  return http_status >= 500 ? StatusCode::Internal : StatusCode::Unknown;
  }
}

CurlHttpClient::CurlHttpClient(Options opts) : opts_(std::move(opts)) {
  global_init_once();
}

nlohmann::json CurlHttpClient::postJson(const std::string& url, const nlohmann::json& body) {
  CURL* curl = curl_easy_init();
  if (!curl) throw TransportError(StatusCode::Internal, "curl_easy_init failed");

  const std::string payload = body.dump();
  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, "Accept: application/json");

  std::string response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(opts_.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "voxturn/0.1");
  if (!opts_.verify_peer) {
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
  }
  if (!opts_.user.empty()) {
    curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl, CURLOPT_USERNAME, opts_.user.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, opts_.password.c_str());
  }

  CURLcode res = curl_easy_perform(curl);
  long code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    StatusCode status = res == CURLE_OPERATION_TIMEDOUT ? StatusCode::DeadlineExceeded : StatusCode::Unavailable;
    throw TransportError(status, std::string("POST ") + url + ": " + curl_easy_strerror(res));
  }

  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(response);
  } catch (const nlohmann::json::parse_error& e) {
    StatusCode status = statusFromHttpReply(code);
    if (status == StatusCode::Ok) status = StatusCode::Internal;
    throw TransportError(status, "HTTP " + std::to_string(code) + " reply is not JSON: " + e.what());
  }
  // a JSON error body is the caller's to interpret
  return reply;
}

} // namespace voxturn
