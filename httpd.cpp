#include <string.h>
#include <time.h>

#include <sstream>
#include <string>

#include "exposition.h"
#include "httpd.h"
#include "logging.h"

MHD_Result HTTPServer::urlHandler(void *cls, struct MHD_Connection *connection, const char *url,
                                  const char *method, const char *version,
                                  const char *upload_data, size_t *upload_data_size, void **con_cls)
{
    HTTPServer* pServer = (HTTPServer*)cls;

    return pServer->handleRequest(connection, url, method);
}

HTTPServer::HTTPServer(unsigned short port, unsigned int threads, const MetricsStore& store)
    : m_Store(store)
{
    m_httpd = MHD_start_daemon(MHD_USE_SELECT_INTERNALLY|MHD_USE_ERROR_LOG, port,
                               NULL, NULL, urlHandler, this,
                               MHD_OPTION_THREAD_POOL_SIZE, threads,
                               MHD_OPTION_END);
    if (!m_httpd) {
        fatal("Failed to start httpd on port %u", (unsigned int)port);
    }

    Log(Log::INFO) << "HTTP server listening on port " << port;
}

HTTPServer::~HTTPServer()
{
    MHD_stop_daemon(m_httpd);
}

MHD_Result HTTPServer::handleRequest(struct MHD_Connection *connection, const char* url,
                                     const char* method)
{
    struct MHD_Response *response;
    unsigned int res = MHD_HTTP_OK;
    const char* contentType = "text/plain; charset=utf-8";
    std::stringstream output;

    if (strcmp(method, MHD_HTTP_METHOD_GET) && strcmp(method, MHD_HTTP_METHOD_HEAD)) {
        res = MHD_HTTP_METHOD_NOT_ALLOWED;
        output << "405 Method Not Allowed";
    } else if (!strcmp(url, "/metrics")) {
        FormatMetrics(output, m_Store.Snapshot());
        contentType = MetricsContentType;
    } else if (!strcmp(url, "/health")) {
        output << "OK";
    } else if (!strcmp(url, "/")) {
        FormatStatusPage(output, m_Store.Snapshot(), time(nullptr));
        contentType = "text/html; charset=utf-8";
    } else {
        res = MHD_HTTP_NOT_FOUND;
        output << "404 Not Found";
    }

    std::string str = output.str();

    response = MHD_create_response_from_buffer(str.length(), (void*)str.c_str(), MHD_RESPMEM_MUST_COPY);
    if (!response) {
        Log(Log::ERR) << "Failed to create HTTP response for " << url;
        return MHD_NO;
    }

    if (MHD_add_response_header(response, MHD_HTTP_HEADER_CONTENT_TYPE, contentType) != MHD_YES) {
        Log(Log::WARN) << "Failed to set Content-Type for " << url;
    }

    MHD_Result ret = MHD_queue_response(connection, res, response);
    MHD_destroy_response(response);

    return ret;
}
