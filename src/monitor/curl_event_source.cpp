#include "curl_event_source.hpp"

#include <curl/curl.h>
#include <format>
#include <print>

namespace {

struct Transfer {
    Scheduler& scheduler;
    std::shared_ptr<std::atomic<uint64_t>> generation;
    uint64_t gen;
    EventSource::Handlers handlers;
    std::stop_token stop;
    CURL* curl = nullptr;
    SseParser parser;
    bool opened = false;
    long http_status = 0;

    // Runs `fn` on the scheduler unless the connection was replaced meanwhile.
    template <typename Fn>
    void post(Fn fn) {
        scheduler.post([generation = generation, gen = gen, fn = std::move(fn)]() mutable {
            if (generation->load(std::memory_order_acquire) != gen) return;
            fn();
        });
    }
};

size_t header_callback(char* ptr, size_t size, size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = size * nitems;
    std::string_view line(ptr, n);

    // Blank line ends a header block
    if (line == "\r\n" || line == "\n") {
        curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &t->http_status);
        if (t->http_status == 200 && !t->opened) {
            t->opened = true;
            t->post([h = t->handlers] { if (h.on_open) h.on_open(); });
        }
    }
    return n;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = size * nmemb;

    // Abort non-stream responses
    if (!t->opened) return 0;

    for (auto& msg : t->parser.feed(std::string_view(ptr, n))) {
        t->post([h = t->handlers, msg = std::move(msg)] { if (h.on_message) h.on_message(msg); });
    }
    return n;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(userdata);
    return t->stop.stop_requested() ? 1 : 0;
}

void run_transfer(Transfer& t, const std::string& url) {
    t.curl = curl_easy_init();
    if (!t.curl) {
        t.post([h = t.handlers] { if (h.on_error) h.on_error("curl_easy_init failed"); });
        return;
    }

    curl_slist* headers = curl_slist_append(nullptr, "Accept: text/event-stream");

    curl_easy_setopt(t.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(t.curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(t.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(t.curl, CURLOPT_HEADERDATA, &t);
    curl_easy_setopt(t.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(t.curl, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(t.curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(t.curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(t.curl, CURLOPT_XFERINFODATA, &t);
    curl_easy_setopt(t.curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(t.curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(t.curl);

    curl_slist_free_all(headers);
    curl_easy_cleanup(t.curl);
    t.curl = nullptr;

    if (t.stop.stop_requested()) return;

    std::string reason;
    if (!t.opened && t.http_status != 0) {
        reason = std::format("HTTP {}", t.http_status);
    } else if (res == CURLE_OK) {
        reason = "stream closed by server";
    } else {
        reason = std::string("curl error: ") + curl_easy_strerror(res);
    }
    t.post([h = t.handlers, reason] { if (h.on_error) h.on_error(reason); });
}

} // namespace

CurlEventSource::CurlEventSource(Scheduler& scheduler, bool verbose)
    : scheduler_(scheduler), verbose_(verbose),
      generation_(std::make_shared<std::atomic<uint64_t>>(0)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlEventSource::~CurlEventSource() {
    close();
    curl_global_cleanup();
}

void CurlEventSource::open(const std::string& url, Handlers handlers) {
    close();
    uint64_t gen = generation_->load(std::memory_order_acquire);
    log("Connecting to " + url);

    thread_ = std::jthread([&scheduler = scheduler_, generation = generation_, gen, url,
                            handlers = std::move(handlers)](std::stop_token stop) {
        Transfer t{.scheduler = scheduler,
                   .generation = generation,
                   .gen = gen,
                   .handlers = handlers,
                   .stop = stop};
        run_transfer(t, url);
    });
}

void CurlEventSource::close() {
    generation_->fetch_add(1, std::memory_order_acq_rel);
    // Move-assignment requests stop and joins the running transfer
    thread_ = std::jthread{};
}

void CurlEventSource::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[sweepwatch] {}", msg);
    }
}
