// GPL-3.0-or-later (see LICENSE or https://www.gnu.org/licenses/gpl-3.0.txt)
#pragma once
#include <cassert>
#include <string>
#include <variant>

/**
 * A failed download. http_status is 0 when no HTTP response was received.
 */
class curl_wrapper_error
{
  public:

    explicit curl_wrapper_error(std::string const& msg, std::string const& url = "", long http_status = 0)
      : m_msg(msg), m_url(url), m_http_status(http_status)
    {}
    virtual ~curl_wrapper_error() = default;

    curl_wrapper_error(curl_wrapper_error const&) = default;
    curl_wrapper_error& operator=(curl_wrapper_error const&) = default;

    virtual const char* what() const noexcept
    {
      return m_msg.c_str();
    }

    virtual std::string url() const noexcept
    {
      return m_url;
    }

    virtual long http_status() const noexcept
    {
      return m_http_status;
    }

  private:

    std::string m_msg;
    std::string m_url;
    long m_http_status;
};

/**
 * Before using curl_wrapper call curl_wrapper::init()
 * and after usage call curl_wrapper::cleanup().
 */
class curl_wrapper
{
  public:

    static void init();     // Call before curl_wrapper-usage (not thread-safe)!
    static void cleanup();  // Call after  curl_wrapper-usage (not thread-safe)!

  public:

    curl_wrapper()
      : curl_wrapper("m3u_unpack/0.1")
    {}
    explicit curl_wrapper(std::string const& useragent)
      : m_useragent(useragent)
    {}

    curl_wrapper(curl_wrapper const&) = default;
    curl_wrapper(curl_wrapper&&) = default;

    virtual ~curl_wrapper() = default;

    curl_wrapper& operator=(curl_wrapper const&) = default;
    curl_wrapper& operator=(curl_wrapper&&) = default;


  public:

    //! Download url completely into memory.
    //! Redirects are followed, HTTP status codes >= 400 are errors.
    auto download_text(std::string const& url) const
      -> std::variant<std::string, curl_wrapper_error>;


  public:

    void useragent(std::string const& ua)
    {
      assert(not ua.empty());
      m_useragent = ua;
    }

    auto useragent() const -> std::string
    {
      return m_useragent;
    }

    void set_verbose()    { m_verbose_flag = true; }
    void clear_verbose()  { m_verbose_flag = false; }
    bool verbose() const  { return m_verbose_flag; }


  private:

    std::string m_useragent;
    bool m_verbose_flag = false;
};
