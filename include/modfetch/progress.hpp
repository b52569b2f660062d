#ifndef MODFETCH_PROGRESS_HPP
#define MODFETCH_PROGRESS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <modfetch/enums.hpp>

namespace modfetch
{
    struct RunReport
    {
        RunState state = RunState::kCOMPLETED;
        std::size_t already_satisfied = 0;
        std::size_t queued = 0;
        std::size_t completed = 0;
        std::vector<std::string> abandoned;
    };

    /**
     * Observer of a download run.
     *
     * `set_current` and `update_progress` are called from the transfer worker, the other
     * methods from the thread driving the run. Implementations own any marshalling to a
     * presentation layer.
     */
    class ProgressSink
    {
    public:
        virtual ~ProgressSink() = default;

        virtual void set_total_count(std::size_t count) = 0;
        virtual void set_already_satisfied(std::size_t /*count*/)
        {
        }
        virtual void set_current(const std::string& file_name,
                                 std::uintmax_t total_size,
                                 std::uintmax_t already_downloaded)
            = 0;
        // `rate` is in bytes per second, empty when it cannot be computed.
        virtual void update_progress(std::uintmax_t bytes_downloaded, std::optional<double> rate)
            = 0;
        virtual void finished(const RunReport& /*report*/)
        {
        }
    };
}

#endif
