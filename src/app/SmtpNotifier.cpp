#include "app/SmtpNotifier.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace netstatus::app {

namespace {

struct UploadCursor {
  const std::string* data;
  size_t offset;
};

size_t read_payload(char* buf, size_t size, size_t nmemb, void* userp) {
  auto* cur = static_cast<UploadCursor*>(userp);
  size_t room = size * nmemb;
  size_t left = cur->data->size() - cur->offset;
  size_t n = std::min(room, left);
  if (n == 0) return 0;
  std::memcpy(buf, cur->data->data() + cur->offset, n);
  cur->offset += n;
  return n;
}

std::string rfc5322_date(model::Clock::time_point ts) {
  auto t = model::Clock::to_time_t(ts);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S +0000", &tm);
  return buf;
}

} // namespace

SmtpNotifier::SmtpNotifier(SmtpSettings settings, AlertEngine engine)
    : settings_(std::move(settings)), engine_(std::move(engine)) {}

std::string SmtpNotifier::build_message(const SmtpSettings& s, const std::string& body,
                                        model::Clock::time_point ts) {
  std::string m;
  m += "Date: " + rfc5322_date(ts) + "\r\n";
  m += "From: " + s.from + "\r\n";
  m += "To: " + s.to + "\r\n";
  m += "Subject: " + s.subject + "\r\n";
  m += "Content-Type: text/plain; charset=utf-8\r\n";
  m += "\r\n";
  m += body;
  m += "\r\n";
  return m;
}

void SmtpNotifier::notify(const model::StateChange& change) {
  auto alert = engine_.evaluate(change);
  if (!alert) return;
  send(build_message(settings_, alert->message, change.timestamp));
  std::fprintf(stderr, "netstatus: email alert sent to %s\n", settings_.to.c_str());
}

void SmtpNotifier::send(const std::string& payload) {
  CURL* c = curl_easy_init();
  if (!c) throw std::runtime_error("smtp: curl_easy_init failed");

  std::string url = "smtp://" + settings_.server + ":" + std::to_string(settings_.port);
  std::string mail_from = "<" + settings_.from + ">";
  std::string mail_to = "<" + settings_.to + ">";
  struct curl_slist* rcpt = nullptr;
  rcpt = curl_slist_append(rcpt, mail_to.c_str());
  UploadCursor cursor{&payload, 0};

  curl_easy_setopt(c, CURLOPT_URL, url.c_str());
  curl_easy_setopt(c, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
  if (!settings_.username.empty()) {
    curl_easy_setopt(c, CURLOPT_USERNAME, settings_.username.c_str());
    curl_easy_setopt(c, CURLOPT_PASSWORD, settings_.password.c_str());
  }
  curl_easy_setopt(c, CURLOPT_MAIL_FROM, mail_from.c_str());
  curl_easy_setopt(c, CURLOPT_MAIL_RCPT, rcpt);
  curl_easy_setopt(c, CURLOPT_READFUNCTION, read_payload);
  curl_easy_setopt(c, CURLOPT_READDATA, &cursor);
  curl_easy_setopt(c, CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(c, CURLOPT_TIMEOUT, static_cast<long>(settings_.timeout.count()));
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);

  auto rc = curl_easy_perform(c);
  curl_slist_free_all(rcpt);
  curl_easy_cleanup(c);
  if (rc != CURLE_OK) {
    throw std::runtime_error(std::string("smtp: ") + curl_easy_strerror(rc));
  }
}

} // namespace netstatus::app
