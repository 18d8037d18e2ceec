#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace CadPreview {

struct StepConversionResult {
    bool ok = false;
    std::vector<uint8_t> stl;
    std::string error;
};

// STEP -> STL mesh approximation.
class StepConverter {
public:
    virtual ~StepConverter() = default;
    virtual bool available() const = 0;
    virtual StepConversionResult convert(const std::vector<uint8_t>& stepBytes, const std::string& requestId) = 0;
};

// Runs an external tool. `commandTemplate` is split on whitespace; the tokens
// {input} and {output} are replaced with temporary file paths. The tool must
// write an STL (binary or ASCII) to {output} and exit 0.
class ExternalStepConverter : public StepConverter {
public:
    ExternalStepConverter(std::string commandTemplate, int timeoutSeconds = 120);

    bool available() const override { return !commandTemplate_.empty(); }
    StepConversionResult convert(const std::vector<uint8_t>& stepBytes, const std::string& requestId) override;

private:
    bool runProcess(const std::vector<std::string>& argv, std::string* outError) const;

    std::string commandTemplate_;
    int timeoutSeconds_;
};

// Cheap sanity check that bytes look like an STL file.
bool looksLikeStl(const std::vector<uint8_t>& bytes);

} // namespace CadPreview
