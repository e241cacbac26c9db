#include "buildjail/libcontainer/filetransfer.hh"
#include "buildjail/libcontainer/globals.hh"
#include "buildjail/libutil/file-descriptor.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/finally.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/strings.hh"

#include <curl/curl.h>

#include <fcntl.h>
#include <mutex>

namespace buildjail {

namespace {

struct CurlFileTransfer : public FileTransfer
{
    std::chrono::seconds connectTimeout;

    explicit CurlFileTransfer(std::chrono::seconds connectTimeout)
        : connectTimeout(connectTimeout)
    {
        static std::once_flag globalInit;
        std::call_once(globalInit, curl_global_init, CURL_GLOBAL_ALL);
    }

    struct TransferItem
    {
        const std::string & uri;
        const Path & destination;
        CURL * req;
        AutoCloseFD fd;
        std::string errorBody;
        size_t bodySize = 0;
        std::exception_ptr writeException;

        long getHTTPStatus()
        {
            long statusCode = 0;
            curl_easy_getinfo(req, CURLINFO_RESPONSE_CODE, &statusCode);
            return statusCode;
        }

        size_t writeCallback(void * contents, size_t size, size_t nmemb)
        {
            auto realSize = size * nmemb;
            std::string_view data{static_cast<char *>(contents), realSize};
            try {
                auto httpStatus = getHTTPStatus();
                /* Error pages are kept for the error message instead
                   of ending up in the destination file. */
                if (httpStatus >= 300) {
                    errorBody.append(data);
                    return realSize;
                }
                if (!fd) {
                    fd = AutoCloseFD{open(destination.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
                    if (!fd)
                        throw SysError("creating file '%s'", destination);
                }
                writeFull(fd.get(), data);
                bodySize += realSize;
                return realSize;
            } catch (...) {
                writeException = std::current_exception();
                return 0;
            }
        }

        static size_t writeCallbackWrapper(void * contents, size_t size, size_t nmemb, void * userp)
        {
            return static_cast<TransferItem *>(userp)->writeCallback(contents, size, nmemb);
        }

        static int debugCallback(CURL * handle, curl_infotype type, char * data, size_t size, void * userptr)
        {
            if (type == CURLINFO_TEXT)
                vomit("curl: %s", chomp(std::string(data, size)));
            return 0;
        }
    };

    void download(const std::string & uri, const Path & destination) override
    {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> req{curl_easy_init(), curl_easy_cleanup};
        if (!req)
            throw FileTransferError(Misc, {}, "could not allocate curl handle");

        TransferItem item{.uri = uri, .destination = destination, .req = req.get()};
        char errbuf[CURL_ERROR_SIZE];
        errbuf[0] = 0;

        printInfo("downloading '%s'", uri);

        if (verbosity >= lvlVomit) {
            curl_easy_setopt(req.get(), CURLOPT_VERBOSE, 1);
            curl_easy_setopt(req.get(), CURLOPT_DEBUGFUNCTION, TransferItem::debugCallback);
        }

        curl_easy_setopt(req.get(), CURLOPT_URL, uri.c_str());
        curl_easy_setopt(req.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(req.get(), CURLOPT_MAXREDIRS, 10);
        curl_easy_setopt(req.get(), CURLOPT_NOSIGNAL, 1);
        curl_easy_setopt(req.get(), CURLOPT_USERAGENT,
            ("curl/" LIBCURL_VERSION " buildjail/" + buildjailVersion).c_str());
        curl_easy_setopt(req.get(), CURLOPT_WRITEFUNCTION, TransferItem::writeCallbackWrapper);
        curl_easy_setopt(req.get(), CURLOPT_WRITEDATA, &item);
        curl_easy_setopt(req.get(), CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(req.get(), CURLOPT_PROTOCOLS_STR, "http,https,ftp,ftps,file");
        if (connectTimeout.count())
            curl_easy_setopt(req.get(), CURLOPT_CONNECTTIMEOUT_MS,
                static_cast<long>(std::chrono::milliseconds(connectTimeout).count()));

        /* Give up on stalled downloads. */
        curl_easy_setopt(req.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(req.get(), CURLOPT_LOW_SPEED_TIME, 300L);

        auto code = curl_easy_perform(req.get());
        auto httpStatus = item.getHTTPStatus();

        debug("finished download of '%s'; curl status = %d, HTTP status = %d, body = %d bytes",
            uri, code, httpStatus, item.bodySize);

        if (item.writeException)
            std::rethrow_exception(item.writeException);

        /* `file://` transfers report no HTTP status. */
        if (code == CURLE_OK && (httpStatus == 0 || (httpStatus >= 200 && httpStatus < 300))) {
            if (!item.fd) {
                /* Empty body: still produce the file. */
                item.fd = AutoCloseFD{open(destination.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
                if (!item.fd)
                    throw SysError("creating file '%s'", destination);
            }
            item.fd.close();
            return;
        }

        // We treat most errors as transient
        Error err = Transient;

        if (httpStatus == 404 || httpStatus == 410 || code == CURLE_FILE_COULDNT_READ_FILE) {
            err = NotFound;
        } else if (httpStatus == 401 || httpStatus == 403 || httpStatus == 407) {
            err = Forbidden;
        } else if (httpStatus >= 400 && httpStatus < 500 && httpStatus != 408 && httpStatus != 429) {
            err = Misc;
        } else if (httpStatus == 501 || httpStatus == 505 || httpStatus == 511) {
            err = Misc;
        } else {
            #pragma GCC diagnostic push
            #pragma GCC diagnostic ignored "-Wswitch-enum"
            switch (code) {
                case CURLE_FAILED_INIT:
                case CURLE_URL_MALFORMAT:
                case CURLE_NOT_BUILT_IN:
                case CURLE_REMOTE_ACCESS_DENIED:
                case CURLE_FUNCTION_NOT_FOUND:
                case CURLE_BAD_FUNCTION_ARGUMENT:
                case CURLE_INTERFACE_FAILED:
                case CURLE_UNKNOWN_OPTION:
                case CURLE_SSL_CACERT_BADFILE:
                case CURLE_TOO_MANY_REDIRECTS:
                case CURLE_WRITE_ERROR:
                case CURLE_UNSUPPORTED_PROTOCOL:
                    err = Misc;
                    break;
                default:
                    break;
            }
            #pragma GCC diagnostic pop
        }

        auto textualError = [](const char * errbuf, CURLcode code) -> const char * {
            if (errbuf && errbuf[0]) {
                return errbuf;
            } else {
                return curl_easy_strerror(code);
            }
        };

        std::optional<std::string> response;
        if (!item.errorBody.empty())
            response = std::move(item.errorBody);

        if (httpStatus != 0)
            throw FileTransferError(
                err,
                std::move(response),
                "unable to download '%s': HTTP error %d%s",
                uri,
                httpStatus,
                code == CURLE_OK
                    ? ""
                    : fmt(" (curl error code=%d: %s)", code, textualError(errbuf, code)));
        throw FileTransferError(
            err,
            std::move(response),
            "unable to download '%s': %s (curl error code=%d)",
            uri,
            textualError(errbuf, code),
            code);
    }
};

}

std::unique_ptr<FileTransfer> makeCurlFileTransfer(std::chrono::seconds connectTimeout)
{
    return std::make_unique<CurlFileTransfer>(connectTimeout);
}

std::string uriFileName(std::string_view uri)
{
    auto end = uri.find_first_of("?#");
    if (end != uri.npos)
        uri = uri.substr(0, end);
    while (!uri.empty() && uri.back() == '/')
        uri.remove_suffix(1);
    auto slash = uri.rfind('/');
    auto name = slash == uri.npos ? uri : uri.substr(slash + 1);
    if (name.empty() || name == "." || name == "..")
        throw UsageError("cannot determine a file name for '%s'", uri);
    return std::string(name);
}

Path downloadCached(FileTransfer & transfer, const std::string & uri, const Path & cacheDir)
{
    auto target = cacheDir + "/" + uriFileName(uri);
    if (pathExists(target)) {
        debug("using cached '%s'", target);
        return target;
    }

    createDirs(cacheDir);
    auto tmp = makeTempPath(target, ".download");
    Finally cleanup([&]() {
        if (pathExists(tmp)) deletePath(tmp);
    });
    transfer.download(uri, tmp);
    renameFile(tmp, target);
    return target;
}

}
