// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#include <array>
#include <cassert>
#include <iostream>
#include <memory> // std::unique_ptr
#include <string>

#include <fmt/format.h>

#include "curl_wrapper.h"

#include <curl/curl.h>

// ---

// See Global preparation at https://curl.se/libcurl/c/libcurl-tutorial.html
void curl_wrapper::init()
{
  curl_global_init(CURL_GLOBAL_ALL);
}

void curl_wrapper::cleanup()
{
  curl_global_cleanup();
}

namespace
{
  auto append_text(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t;

  struct easy_cleanup_t
  {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
  };

  //! Easy handle with its error buffer.
  //! CURLOPT_ERRORBUFFER points into this object, so it can't be copied or moved.
  struct curl_handle_t
  {
    curl_handle_t() = default;

    curl_handle_t(curl_handle_t const&) = delete;
    auto operator=(curl_handle_t const&) -> curl_handle_t& = delete;

    bool init()
    {
      m_errbuf.fill('\0');

      m_handle.reset(curl_easy_init());
      if(m_handle == nullptr)
        return false;

      curl_easy_setopt(m_handle.get(), CURLOPT_ERRORBUFFER, m_errbuf.data());
      return true;
    }

    inline auto get() const -> CURL* { return m_handle.get(); }

    //! The detailed message of the error buffer or the generic one of res.
    auto errormsg(CURLcode res) const -> std::string
    {
      std::string const msg{m_errbuf.data()};
      return msg.empty() ? std::string{curl_easy_strerror(res)} : msg;
    }

    std::unique_ptr<CURL, easy_cleanup_t> m_handle = nullptr;
    std::array<char, CURL_ERROR_SIZE> m_errbuf = {};
  };
} // namespace

// ---

auto curl_wrapper::download_text(std::string const& url) const
  -> std::variant<std::string, curl_wrapper_error>
{
  assert(not url.empty());
  std::string text = "";

  curl_handle_t handle;
  if(not handle.init())
    return curl_wrapper_error{"Initialising curl handle failed", url};

  if(m_verbose_flag)
    std::cout << fmt::format("Try to download: {}", url) << std::endl;

  CURL* const h = handle.get();
  curl_easy_setopt(h, CURLOPT_URL,            url.c_str());
  curl_easy_setopt(h, CURLOPT_USERAGENT,      m_useragent.c_str());
  curl_easy_setopt(h, CURLOPT_VERBOSE,        m_verbose_flag ? 1L : 0L);
  curl_easy_setopt(h, CURLOPT_NOPROGRESS,     1L);
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_FAILONERROR,    1L); // HTTP >= 400 -> CURLE_HTTP_RETURNED_ERROR

  // https://curl.se/libcurl/c/CURLOPT_WRITEFUNCTION.html
  curl_easy_setopt(h, CURLOPT_WRITEDATA,      &text);
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION,  append_text);

  CURLcode const res = curl_easy_perform(h);

  long http_status = 0;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_status);

  if(res != CURLE_OK)
    return curl_wrapper_error{handle.errormsg(res), url, http_status};
  // else
  return text;
}

// ---

namespace
{
  //
  // Callbacks
  //

  auto append_text(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
  {
    auto text = reinterpret_cast<std::string*>(userdata);
    text->append(ptr, size*nmemb);
    return size*nmemb;
  }
} // namespace
