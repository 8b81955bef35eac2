#include "route_planner/fetch.hpp"

#include <curl/curl.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace route_planner
{
    namespace
    {
        size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp)
        {
            static_cast<std::string *>(userp)->append(static_cast<char *>(contents), size * nmemb);
            return size * nmemb;
        }

        bool starts_with(const std::string &value, const std::string &prefix)
        {
            return value.compare(0, prefix.size(), prefix) == 0;
        }
    }

    bool is_remote_source(const std::string &source)
    {
        return starts_with(source, "http://") || starts_with(source, "https://");
    }

    std::string fetch_remote_text(const std::string &url)
    {
        std::cout << "Fetching dataset from " << url << "..." << std::endl;

        CURL *curl = curl_easy_init();
        if (!curl)
        {
            throw std::runtime_error("Failed to initialize CURL");
        }

        std::string response_data;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "RoutePlanner/1.0");
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

        const CURLcode res = curl_easy_perform(curl);
        long http_code = 0;
        if (res == CURLE_OK)
        {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        }
        curl_easy_cleanup(curl);

        if (res != CURLE_OK)
        {
            throw std::runtime_error(std::string("Connection failed: ") + curl_easy_strerror(res));
        }
        if (http_code != 200)
        {
            throw std::runtime_error("HTTP " + std::to_string(http_code) + " while fetching " + url);
        }

        std::cout << "Fetched " << response_data.size() << " bytes from " << url << std::endl;
        return response_data;
    }

    std::string read_source_text(const std::string &source)
    {
        if (is_remote_source(source))
        {
            return fetch_remote_text(source);
        }

        std::ifstream in(source);
        if (!in.is_open())
        {
            throw std::runtime_error("Unable to open " + source);
        }

        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

}
