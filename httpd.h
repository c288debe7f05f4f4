#ifndef HTTPD_H
#define HTTPD_H

#include <microhttpd.h>

#include "metrics_store.h"

/*
 * Scrape endpoint. Requests are served from libmicrohttpd's own thread
 * pool and only ever take snapshots of the store.
 */
class HTTPServer
{
public:
    HTTPServer(unsigned short port, unsigned int threads, const MetricsStore& store);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

private:
    MHD_Result handleRequest(struct MHD_Connection *connection, const char *url, const char *method);

    static MHD_Result urlHandler(void *cls, struct MHD_Connection *connection, const char *url,
                                 const char *method, const char *version,
                                 const char *upload_data, size_t *upload_data_size, void **con_cls);

    struct MHD_Daemon*  m_httpd;
    const MetricsStore& m_Store;
};

#endif
