#include "shell.hpp"

#include "commands.hpp"
#include "logging.hpp"
#include "platform.hpp"
#include "startup.hpp"

#include <saucer/serializers/glaze/glaze.hpp>
#include <saucer/url.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{
    using saucer::modules::picker::type;

    constexpr auto pdf_filter = "*.pdf";

    saucer::modules::picker::options make_picker_options(const std::string &initial)
    {
        saucer::modules::picker::options rtn;
        rtn.filters.emplace(pdf_filter);

        if (!initial.empty())
        {
            rtn.initial = initial;
        }

        return rtn;
    }
} // namespace

namespace twice
{
    shell::shell(twice::options opts, std::shared_ptr<saucer::application> app, std::shared_ptr<saucer::window> window,
                 saucer::smartview view)
        : m_options(std::move(opts)), m_app(std::move(app)), m_window(std::move(window)), m_view(std::move(view)),
          m_desktop(m_app.get()), m_loop(*m_app)
    {
    }

    result<std::unique_ptr<shell>> shell::create(twice::options opts, int argc, char **argv)
    {
        saucer::application::options create_opts{.id = opts.id};

        create_opts.argc = argc;
        create_opts.argv = argv;

        auto app = saucer::application::create(create_opts);
        if (!app.has_value())
        {
            return std::unexpected{error::fatal_startup(fmt::format("application ({})", app.error().code()))};
        }

        auto shared_app = std::make_shared<saucer::application>(std::move(app).value());

        auto window = saucer::window::create(shared_app.get());
        if (!window.has_value())
        {
            return std::unexpected{error::fatal_startup(fmt::format("window ({})", window.error().code()))};
        }

        auto view = saucer::smartview::create({.window = window.value()});
        if (!view.has_value())
        {
            return std::unexpected{error::fatal_startup(fmt::format("webview ({})", view.error().code()))};
        }

        auto rtn = std::unique_ptr<shell>{
            new shell{std::move(opts), std::move(shared_app), window.value(), std::move(view).value()}};

        if (rtn->m_options.debug)
        {
            if (auto attached = attach_logger(rtn->m_options.log_level); !attached.has_value())
            {
                return std::unexpected{std::move(attached).error()};
            }
        }
        else
        {
            quiet_logger();
        }

        spdlog::info("starting {} ({})", rtn->m_options.id, rtn->m_options.debug ? "debug" : "release");

        rtn->m_view.set_dev_tools(rtn->m_options.debug);
        rtn->m_window->set_title(rtn->m_options.title);
        rtn->m_window->set_size({
            .w = static_cast<int>(rtn->m_options.width),
            .h = static_cast<int>(rtn->m_options.height),
        });

        rtn->expose_commands();

        if (auto loaded = rtn->load_frontend(); !loaded.has_value())
        {
            return std::unexpected{std::move(loaded).error()};
        }

        return rtn;
    }

    int shell::run()
    {
        m_window->show();

        spdlog::debug("entering event loop");
        m_loop.run();

        spdlog::info("event loop finished");
        return 0;
    }

    result<void> shell::load_frontend()
    {
        const auto &frontend = m_options.frontend;

        auto url = is_remote(frontend) ? saucer::url::parse(frontend) : saucer::url::from(std::filesystem::path{frontend});

        if (!url.has_value())
        {
            return std::unexpected{
                error::fatal_startup(fmt::format("invalid frontend location {} ({})", frontend, url.error().code()))};
        }

        spdlog::info("loading frontend from {}", frontend);
        m_view.set_url(url.value());

        return {};
    }

    void shell::expose_commands()
    {
        m_view.expose("get_cli_pdf_paths",
                      []
                      {
                          return startup_paths::global().get();
                      });

        m_view.expose("read_pdf_file",
                      [](std::string path, const saucer::executor<std::vector<std::uint8_t>> &exec)
                      {
                          auto contents = read_file(path);

                          if (!contents.has_value())
                          {
                              exec.reject(contents.error().message());
                              return;
                          }

                          exec.resolve(std::move(contents).value());
                      });

        m_view.expose("write_pdf_file",
                      [](std::string path, std::vector<std::uint8_t> data, const saucer::executor<void> &exec)
                      {
                          auto written = write_file(path, data);

                          if (!written.has_value())
                          {
                              exec.reject(written.error().message());
                              return;
                          }

                          exec.resolve();
                      });

        m_view.expose("show_in_folder",
                      [](std::string path, const saucer::executor<void> &exec)
                      {
                          auto revealed = reveal_in_file_manager(path);

                          if (!revealed.has_value())
                          {
                              exec.reject(revealed.error().message());
                              return;
                          }

                          exec.resolve();
                      });

        m_view.expose("open_url",
                      [this](std::string url)
                      {
                          spdlog::debug("opening {}", url);
                          m_desktop.open(url);
                      });

        m_view.expose("pick_pdf_file",
                      [this](std::string initial) -> std::optional<std::string>
                      {
                          auto picked = m_desktop.pick<type::file>(make_picker_options(initial));

                          if (!picked.has_value())
                          {
                              spdlog::debug("file picker closed without a selection ({})", picked.error().code());
                              return std::nullopt;
                          }

                          return picked->string();
                      });

        m_view.expose("pick_save_path",
                      [this](std::string initial) -> std::optional<std::string>
                      {
                          auto picked = m_desktop.pick<type::save>(make_picker_options(initial));

                          if (!picked.has_value())
                          {
                              spdlog::debug("save dialog closed without a selection ({})", picked.error().code());
                              return std::nullopt;
                          }

                          return picked->string();
                      });

        m_view.expose("toggle_fullscreen",
                      [this]
                      {
                          const auto enabled = !m_window->fullscreen();
                          m_window->set_fullscreen(enabled);

                          return enabled;
                      });
    }
} // namespace twice
