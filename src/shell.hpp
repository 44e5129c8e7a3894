#pragma once

#include "error.hpp"
#include "options.hpp"

#include <saucer/app.hpp>
#include <saucer/window.hpp>
#include <saucer/smartview.hpp>
#include <saucer/modules/desktop.hpp>
#include <saucer/modules/loop.hpp>

#include <memory>

namespace twice
{
    /**
     * @brief Owns the saucer application, its window and webview, and the commands exposed to the frontend.
     */
    class shell
    {
        twice::options m_options;

      private:
        std::shared_ptr<saucer::application> m_app;
        std::shared_ptr<saucer::window> m_window;
        saucer::smartview m_view;

      private:
        saucer::modules::desktop m_desktop;
        saucer::modules::loop m_loop;

      private:
        shell(twice::options, std::shared_ptr<saucer::application>, std::shared_ptr<saucer::window>,
              saucer::smartview);

      public:
        shell(const shell &)            = delete;
        shell &operator=(const shell &) = delete;

      public:
        /**
         * @brief Creates the webview, attaches the logger when @param opts asks for it and exposes every command.
         * @note Any failure here is fatal, the event loop is never entered.
         */
        static result<std::unique_ptr<shell>> create(twice::options opts, int argc, char **argv);

      public:
        [[nodiscard]] int run();

      private:
        result<void> load_frontend();
        void expose_commands();
    };
} // namespace twice
