#pragma once

#include <future>

namespace Test
{
    /**
     * @brief Blocks mocked backend calls until the test opens it.
     */
    class Gate
    {
      public:
        void open()
        {
            promise_.set_value();
        }

        void wait() const
        {
            future_.wait();
        }

      private:
        std::promise<void> promise_{};
        std::shared_future<void> future_{promise_.get_future().share()};
    };
}
