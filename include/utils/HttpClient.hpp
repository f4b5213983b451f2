#pragma once
#include <atomic>
#include <map>
#include <string>

namespace Pequod {

class HttpClient {
public:
    HttpClient();

    struct Response {
        int statusCode;
        std::string body;
        std::map<std::string, std::string> headers;
        bool success;
        bool timedOut;
        std::string error;

        std::string contentType() const;
    };

    // Blocking GET. Never throws; failures are described in the response.
    Response get(const std::string& url) const;

    void setUserAgent(const std::string& userAgent);
    void setTimeout(long timeoutSeconds);
    // Transfers abort as soon as the flag becomes true.
    void setCancelFlag(const std::atomic<bool>* cancelFlag);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
    std::string userAgent_;
    long timeout_;
    const std::atomic<bool>* cancelFlag_;
};

}
