#pragma once
//umbrella

#include "CanVss/Core/CANKernelTypes.hpp"
#include "CanVss/Core/CANHelpers.hpp"
#include "CanVss/Core/Errors.hpp"
#include "CanVss/Core/Logging.hpp"
#include "CanVss/Core/Definitions.hpp"
#include "CanVss/Core/Signal/SignalCodec.hpp"
#include "CanVss/Core/Signal/NumericValue.hpp"
#include "CanVss/Core/ParserUtils.hpp"
#include "CanVss/Core/ConversionConcepts.hpp"
#include "CanVss/Core/ConversionBundle.hpp"
#include "CanVss/Mapping/MappingTable.hpp"
#include "CanVss/Mapping/ConfigLoader.hpp"
#include "CanVss/Engine/ConversionEngine.hpp"
#include "CanVss/Buffer/FrameRingBuffer.hpp"
#include "CanVss/Sinks/LoggingSink.hpp"

#ifndef CANVSS_BUILD_CORE_ONLY

#include "CanVss/DBC/DBCInterpreterConcepts.hpp"
#include "CanVss/DBC/DBCInterpreter.hpp"
#include "CanVss/DBC/DBCImporter.hpp"

#endif // CANVSS_BUILD_CORE_ONLY
