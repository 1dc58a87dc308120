namespace bisect
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    ssl_ctx_.set_default_verify_paths ();
    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url)
  {
    request_type req (http_method::get, url);
    req.normalize ();
    co_return co_await request_impl (std::move (req), 0);
  }

  template <typename T>
  inline asio::awaitable<std::uint64_t> basic_http_client<T>::
  download (const string_type& url,
            const string_type& path,
            progress_callback progress)
  {
    co_return co_await download_impl (url, path, std::move (progress), 0);
  }
}
