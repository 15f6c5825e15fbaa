#ifndef LAGRANGE_PARAMS_H
#define LAGRANGE_PARAMS_H

///LagrangeParams - parameters of a filtering run
/** Reads the filter and buffer settings from an xml file (using
    tinyxml2). The file looks like

    <lagrange>
      <name>sanity_test</name>
      <filter>
        <highpassFrequency>2.3148e-05</highpassFrequency>
        <windowSize>61200</windowSize>
        <advectionDt>1800</advectionDt>
      </filter>
      <buffer kind="file">
        <directory>/tmp</directory>
        <sampleVariables>U V</sampleVariables>
      </buffer>
    </lagrange>

    directory and sampleVariables are optional, kind is "file" or
    "memory".
**/

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <logging.h>

#include "lagrange_buffer.h"
#include "lagrange_error.h"
#include "lagrange_filter.h"

namespace tinyxml2 {
class XMLElement;
}

namespace lagrange {

class LagrangeParamsError : public ConfigError
{
public:
    explicit LagrangeParamsError(const std::string& what) : ConfigError(what) {}
};

enum class BufferKind {
    File,
    Memory
};

class LagrangeParams
{
public:
    explicit LagrangeParams(const std::string& xmlFile);

    const std::string& getName() const { return name; }
    double getHighpassFrequency() const { return highpassFrequency; }
    double getWindowSize() const { return windowSize; }
    double getAdvectionDt() const { return advectionDt; }
    /// 1 / advectionDt
    double getSamplingFrequency() const { return 1. / advectionDt; }
    /// advection steps on each side of the window center
    Index getWindowSteps() const;

    BufferKind getBufferKind() const { return bufferKind; }
    const std::string& getBufferDirectory() const { return bufferDirectory; }
    const std::optional<std::vector<std::string>>& getSampleVariables() const {
        return sampleVariables;
    }

private:
    [[noreturn]] void throwXmlError(const std::string& p) const;
    const tinyxml2::XMLElement* child(const tinyxml2::XMLElement* parent,
                                      const char* tag) const;
    double getDouble(const tinyxml2::XMLElement* parent, const char* tag) const;

    std::string xmlFile;
    std::string name;

    ///filter
    double highpassFrequency = 0.;
    double windowSize = 0.;
    double advectionDt = 0.;

    ///buffer
    BufferKind bufferKind = BufferKind::Memory;
    std::string bufferDirectory;
    std::optional<std::vector<std::string>> sampleVariables;

    std::shared_ptr<spdlog::logger> logger;
};

/// the buffer configured in params, sized for the given particles
std::unique_ptr<ParticleBuffer> make_buffer(const LagrangeParams& params,
                                            const ParticleSource& particles);

/// the high-pass filter configured in params
Filter make_filter(const LagrangeParams& params);

} // namespace lagrange

#endif // LAGRANGE_PARAMS_H
