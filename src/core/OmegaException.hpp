//
// OmegaException.hpp
//

#ifndef MINDGAME_OMEGAEXCEPTION_HPP
#define MINDGAME_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include "Types.hpp"

namespace mind::core
{
    // Carries a typed payload plus where it was raised. Deliberately not derived
    // from std::exception: catch sites name the family they can handle.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        // Location line followed by the raising frames; the innermost
        // frames belong to fail() and the constructor and are skipped.
        [[nodiscard]]
        auto to_str(std::size_t skip_frames = 2) const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            std::size_t idx{};
            for (auto const& frame : backtrace_)
            {
                if (idx++ < skip_frames) continue;
                s += std::format("  {}({}): {}\n", frame.source_file(), frame.source_line(), frame.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<mind::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(mind::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed with code ({}): {} [{}:{}]", static_cast<int>(p.data()), p.what(),
                                    p.where().file_name(), p.where().line());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //MINDGAME_OMEGAEXCEPTION_HPP
