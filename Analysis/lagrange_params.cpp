#include <sstream>

#include <tinyxml2.h>

#include <fmt/format.h>

#include "lagrange_params.h"
#include "lagrange_file_buffer.h"
#include "lagrange_memory_buffer.h"
#include "lagrange_window.h"

namespace lagrange {

///LagrangeParams constructor
/** Pulls the filter and buffer parameters from the xml file and checks
    them, so that anything built from them later is valid.
**/
LagrangeParams::LagrangeParams(const std::string& xmlFile)
    : xmlFile(xmlFile), logger(logging::createLogger("params", this))
{
    tinyxml2::XMLDocument xml;
    if (xml.LoadFile(xmlFile.c_str()) != tinyxml2::XML_SUCCESS)
        throwXmlError(fmt::format("cannot load file: {}", xml.ErrorStr()));

    const tinyxml2::XMLElement* xLagrange = xml.FirstChildElement("lagrange");
    if (!xLagrange)
        throwXmlError("<lagrange> not found.");

    const tinyxml2::XMLElement* xtmp = xLagrange->FirstChildElement("name");
    if (xtmp && xtmp->GetText())
        name = xtmp->GetText();

    //the filter section
    const tinyxml2::XMLElement* xFilter = child(xLagrange, "filter");
    highpassFrequency = getDouble(xFilter, "highpassFrequency");
    windowSize = getDouble(xFilter, "windowSize");
    advectionDt = getDouble(xFilter, "advectionDt");

    //sanity check the filter parameters
    if (!(advectionDt > 0.))
        throwXmlError(fmt::format("filter:advectionDt must be positive, got {}", advectionDt));
    if (!(windowSize > 0.))
        throwXmlError(fmt::format("filter:windowSize must be positive, got {}", windowSize));
    if (!(highpassFrequency > 0.) || !(highpassFrequency < getSamplingFrequency() / 2.))
        throwXmlError(fmt::format("filter:highpassFrequency {} outside (0, {})",
                                  highpassFrequency, getSamplingFrequency() / 2.));

    //the buffer section
    const tinyxml2::XMLElement* xBuffer = child(xLagrange, "buffer");
    const char* kind = xBuffer->Attribute("kind");
    if (!kind)
        throwXmlError("buffer:kind not found.");
    std::string skind(kind);
    if (skind == "file")
        bufferKind = BufferKind::File;
    else if (skind == "memory")
        bufferKind = BufferKind::Memory;
    else
        throwXmlError(fmt::format("buffer:kind must be \"file\" or \"memory\", got \"{}\"", skind));

    xtmp = xBuffer->FirstChildElement("directory");
    if (xtmp && xtmp->GetText())
        bufferDirectory = xtmp->GetText();

    xtmp = xBuffer->FirstChildElement("sampleVariables");
    if (xtmp) {
        sampleVariables.emplace();
        if (xtmp->GetText()) {
            std::istringstream ss(xtmp->GetText());
            std::string v;
            while (ss >> v) sampleVariables->push_back(v);
        }
    }

    logger->info("{}: highpass {} with window {} at dt {} ({} steps each side), {} buffer",
                 name.empty() ? xmlFile : name, highpassFrequency, windowSize, advectionDt,
                 getWindowSteps(), skind);
}

Index LagrangeParams::getWindowSteps() const
{
    return windowSteps(windowSize, advectionDt);
}

void LagrangeParams::throwXmlError(const std::string& p) const
{
    throw LagrangeParamsError(fmt::format("XML error in {}: {}", xmlFile, p));
}

const tinyxml2::XMLElement* LagrangeParams::child(const tinyxml2::XMLElement* parent,
                                                  const char* tag) const
{
    const tinyxml2::XMLElement* x = parent->FirstChildElement(tag);
    if (!x)
        throwXmlError(fmt::format("<{}> not found.", tag));
    return x;
}

double LagrangeParams::getDouble(const tinyxml2::XMLElement* parent, const char* tag) const
{
    const tinyxml2::XMLElement* x = parent->FirstChildElement(tag);
    if (!x)
        throwXmlError(fmt::format("{}:{} not found.", parent->Name(), tag));
    double v = 0.;
    if (x->QueryDoubleText(&v) != tinyxml2::XML_SUCCESS)
        throwXmlError(fmt::format("{}:{} is not a number.", parent->Name(), tag));
    return v;
}

std::unique_ptr<ParticleBuffer> make_buffer(const LagrangeParams& params,
                                            const ParticleSource& particles)
{
    switch (params.getBufferKind()) {
    case BufferKind::File:
        return std::make_unique<FileBuffer>(particles, params.getSampleVariables(),
                                            params.getBufferDirectory());
    case BufferKind::Memory:
        return std::make_unique<MemoryBuffer>(particles, params.getSampleVariables());
    }
    throw ConfigError("unknown buffer kind");
}

Filter make_filter(const LagrangeParams& params)
{
    return Filter(params.getHighpassFrequency(), params.getSamplingFrequency());
}

} // namespace lagrange
