#ifndef MODFETCH_ENUMS_HPP
#define MODFETCH_ENUMS_HPP

#define PARTEXT ".part"

namespace modfetch
{
    enum class HeaderCbState
    {
        // Default state
        kDEFAULT,
        // Final HTTP response with a 2xx status line
        kHTTP_STATE_OK,
        // Final HTTP response with a non-2xx status line
        kHTTP_STATE_FAILED,
        // All headers of the final response were received
        kDONE
    };

    // Result of comparing a manifest entry against the destination directory.
    enum class EntryState
    {
        // `name` exists, nothing to download.
        kCOMPLETE,
        // `name.part` exists and is shorter than the expected size.
        kRESUMABLE,
        // Nothing usable on disk, download from offset 0.
        kFRESH,
    };

    enum class TransferStatus
    {
        kSUCCESSFUL,
        kCANCELLED,
    };

    enum class RunState
    {
        kCOMPLETED,
        kABORTED,
        kCANCELLED,
    };

    enum class OrchestratorState
    {
        kIDLE,
        kRESOLVING,
        kTRANSFERRING,
        kDONE,
        kABORTED,
    };

    enum class ErrorCode
    {
        // HTTP returned status code which do not represent success
        MF_BADSTATUS,
        // declared remote length does not match the expected one
        MF_BADSIZE,
        // bad checksum
        MF_BADCHECKSUM,
        // no usable URL could be resolved
        MF_NOURL,
        // manifest is unreadable or malformed
        MF_BADMANIFEST,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };
}

#endif
