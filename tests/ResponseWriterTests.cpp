#include "mockapic/ResponseWriter.hpp"
#include "TestSupport.hpp"

#include <thread>

using namespace mockapic;
using namespace std::chrono_literals;

static MockRecord helloWorld() {
    MockRecord r;
    r.status = 200;
    r.contentType = "text/plain";
    r.charset = "UTF-8";
    r.body = "Hello World";
    r.headers = {{"x-language", "cpp"}, {"cache-control", "no-store"}};
    return r;
}

int main() {
    // --- durations ---
    expect(parseDuration("1000ms") == Duration(1000ms), "1000ms");
    expect(parseDuration("30s") == Duration(30s), "30s");
    expect(parseDuration("1m30s") == Duration(90s), "1m30s");
    expect(parseDuration("1.5s") == Duration(1500ms), "1.5s");
    expect(parseDuration(".5s") == Duration(500ms), ".5s");
    expect(parseDuration("2h") == Duration(2h), "2h");
    expect(parseDuration("250us") == Duration(250us), "250us");
    expect(parseDuration("250\xC2\xB5s") == Duration(250us), "micro sign");
    expect(parseDuration("0") == Duration::zero(), "bare zero");
    expect(parseDuration("-1s") == Duration(-1s), "negative");
    expect(!parseDuration(""), "empty");
    expect(!parseDuration("10"), "missing unit");
    expect(!parseDuration("abc"), "junk");
    expect(!parseDuration("5d"), "unknown unit");
    expect(!parseDuration("s"), "unit without number");
    expect(!parseDuration("."), "lone dot");
    expect(!parseDuration("99999999999h"), "overflow");
    expect(formatDuration(90s) == "1m30s", "format 1m30s");
    expect(formatDuration(60s) == "1m0s", "format 1m0s");
    expect(formatDuration(250ms) == "250ms", "format 250ms");

    // --- header names ---
    expect(canonicalHeaderKey("x-language") == "X-Language", "canonical x-language");
    expect(canonicalHeaderKey("CONTENT-LENGTH") == "Content-Length", "canonical upper");
    expect(canonicalHeaderKey("etag") == "Etag", "canonical single word");
    expect(canonicalHeaderKey("x--a") == "X--A", "canonical double dash");
    expect(canonicalHeaderKey("bad header") == "bad header", "space keeps name verbatim");

    // --- effective delay ---
    ResponseWriter writer(60s);
    expect(writer.effectiveDelay("") == Duration::zero(), "absent delay");
    expect(writer.effectiveDelay("soon") == Duration::zero(), "unparsable delay");
    expect(writer.effectiveDelay("-5s") == Duration::zero(), "negative delay");
    expect(writer.effectiveDelay("2s") == Duration(2s), "delay under the cap");
    expect(writer.effectiveDelay("10m") == Duration(60s), "delay capped");

    CancellationSource never;

    // --- rendering without delay ---
    {
        httplib::Response res;
        bool written = false;
        auto ms = elapsedMillis([&] { written = writer.write(helloWorld(), "", res, never); });
        expect(written, "write completes");
        expect(ms < 100, "no delay is fast");
        expect(res.status == 200, "status");
        expect(res.get_header_value("Content-Type") == "text/plain; charset=UTF-8", "content type with charset");
        expect(res.get_header_value("X-Language") == "cpp", "custom header canonicalized");
        expect(res.get_header_value("Cache-Control") == "no-store", "second header");
        expect(res.body == "Hello World", "body");
    }

    // --- binary body and odd status ---
    {
        MockRecord r = helloWorld();
        r.status = 418;
        r.contentType = "image/png";
        r.charset = "ISO-8859-1";
        r.headers.clear();
        r.body = std::string("\x89PNG\r\n\x1a\n\x00\x00", 10);
        httplib::Response res;
        writer.write(r, "", res, never);
        expect(res.status == 418, "teapot");
        expect(res.get_header_value("Content-Type") == "image/png; charset=ISO-8859-1", "png content type");
        expect(res.body == r.body, "binary body byte-identical");
    }

    // --- a stored header that repeats another name replaces it ---
    {
        MockRecord r = helloWorld();
        r.headers = {{"X-Trace", "1"}, {"x-trace", "2"}};
        httplib::Response res;
        writer.write(r, "", res, never);
        expect(res.get_header_value_count("X-Trace") == 1, "one value per header name");
    }

    // --- requested delay ---
    {
        httplib::Response res;
        auto ms = elapsedMillis([&] { writer.write(helloWorld(), "1000ms", res, never); });
        expect(ms >= 950 && ms < 1100, "1000ms delay took " + std::to_string(ms) + "ms");
        expect(res.status == 200, "rendered after delay");
    }

    // --- delay above the server maximum ---
    {
        ResponseWriter capped(1000ms);
        httplib::Response res;
        auto ms = elapsedMillis([&] { capped.write(helloWorld(), "30s", res, never); });
        expect(ms >= 950 && ms < 1100, "capped delay took " + std::to_string(ms) + "ms");
    }

    // --- cancellation ends the wait and renders nothing ---
    {
        CancellationSource shutdown;
        httplib::Response res;
        bool written = true;
        std::thread canceller([&] {
            std::this_thread::sleep_for(100ms);
            shutdown.cancel();
        });
        auto ms = elapsedMillis([&] { written = writer.write(helloWorld(), "30s", res, shutdown); });
        canceller.join();
        expect(!written, "cancelled write reports false");
        expect(ms < 1000, "cancel ends the wait early");
        expect(res.body.empty() && !res.has_header("Content-Type"), "nothing rendered after cancel");
    }

    // --- an abandoned request ends the wait too ---
    {
        httplib::Response res;
        auto start = std::chrono::steady_clock::now();
        auto gone = [start] { return std::chrono::steady_clock::now() - start > 150ms; };
        bool written = true;
        auto ms = elapsedMillis([&] { written = writer.write(helloWorld(), "30s", res, never, gone); });
        expect(!written, "abandoned write reports false");
        expect(ms < 1000, "abandoned wait ends at the next poll");
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
