#include "dropcode/server/code_generator.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "dropcode/crypto.hpp"
#include "dropcode/error_codes.hpp"

namespace dropcode::server
{

    namespace
    {
        constexpr std::size_t kMaxAttempts = 1024;
    } // namespace

    CodeGenerator::CodeGenerator()
        : source_([](std::uint32_t bound)
                  { return crypto::random_uniform(bound); })
    {
    }

    CodeGenerator::CodeGenerator(RandomSource source)
        : source_(std::move(source))
    {
    }

    std::string CodeGenerator::generate(const TakenPredicate &is_taken) const
    {
        for (std::size_t attempt = 0; attempt < kMaxAttempts; ++attempt)
        {
            auto candidate = draw();
            if (!is_taken(candidate))
            {
                return candidate;
            }
            spdlog::debug("Code collision on attempt {}, drawing again", attempt + 1);
        }
        throw ServiceError(ErrorCode::InternalError, "Unable to allocate a unique code");
    }

    bool CodeGenerator::is_well_formed(std::string_view code) noexcept
    {
        if (code.size() != kCodeLength)
        {
            return false;
        }
        for (const char ch : code)
        {
            if (kAlphabet.find(ch) == std::string_view::npos)
            {
                return false;
            }
        }
        return true;
    }

    std::string CodeGenerator::draw() const
    {
        std::string code;
        code.reserve(kCodeLength);
        for (std::size_t i = 0; i < kCodeLength; ++i)
        {
            const auto index = source_(static_cast<std::uint32_t>(kAlphabet.size()));
            code.push_back(kAlphabet[index % kAlphabet.size()]);
        }
        return code;
    }

} // namespace dropcode::server
