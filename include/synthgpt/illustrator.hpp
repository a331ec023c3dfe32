// SynthGPT illustration
//   optional side channel turning an attempt's rationale into an image.
//
// Copyright (c) 2025, Lawrence Livermore National Security, LLC.
// All rights reserved.  LLNL-CODE-2001821
//
// License: SPDX BSD 3-Clause "New" or "Revised" License
//          see LICENSE file for details
//
// Authors: pirkelbauer2,liao6 (at) llnl.gov

#ifndef SYNTHGPT_ILLUSTRATOR_HPP
#define SYNTHGPT_ILLUSTRATOR_HPP 1

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace synthgpt
{

/// abstract interface of an illustration generator
class Illustrator
{
  public:
    virtual ~Illustrator() = default;

    /// returns the location of an image illustrating \p rationale, or
    ///   nothing if no image was produced.
    virtual std::optional<std::string>
    illustrate(const std::string& rationale, std::int64_t sessionId, std::size_t attempt) = 0;
};


/// an Illustrator running an external command.
/// \details
///   the command line may refer to ${prompt} and ${output}, which are
///   replaced by the image prompt and the file the image is expected in.
class ScriptIllustrator : public Illustrator
{
  public:
    /// \throws std::invalid_argument if \p budget is less than 1s
    ScriptIllustrator( std::string commandLine,
                       std::string imageDir,
                       std::chrono::seconds budget = std::chrono::seconds(300)
                     );

    std::optional<std::string>
    illustrate(const std::string& rationale, std::int64_t sessionId, std::size_t attempt) override;

    /// returns the image prompt for \p rationale
    static
    std::string imagePrompt(const std::string& rationale);

    /// returns the image file name for an attempt
    std::string imageFile(std::int64_t sessionId, std::size_t attempt) const;

  private:
    std::string          command;
    std::string          dir;
    std::chrono::seconds limit;
};

}

#endif /* SYNTHGPT_ILLUSTRATOR_HPP */
