#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace dropcode::server
{

    /**
     * Issues short codes meant to be read aloud and typed by hand. The alphabet
     * leaves out 0/O and 1/I.
     */
    class CodeGenerator
    {
    public:
        // Returns a value in [0, bound).
        using RandomSource = std::function<std::uint32_t(std::uint32_t bound)>;
        using TakenPredicate = std::function<bool(const std::string &code)>;

        static constexpr std::string_view kAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
        static constexpr std::size_t kCodeLength = 8;

        CodeGenerator();
        explicit CodeGenerator(RandomSource source);

        // Draws until a code not reported as taken comes up.
        std::string generate(const TakenPredicate &is_taken) const;

        static bool is_well_formed(std::string_view code) noexcept;

    private:
        std::string draw() const;

        RandomSource source_;
    };

} // namespace dropcode::server
