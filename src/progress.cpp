#include "progress.hpp"

const char *phaseName(ProgressPhase phase)
{
    switch (phase)
    {
    case ProgressPhase::Skip:
        return "skip";
    case ProgressPhase::Start:
        return "start";
    case ProgressPhase::Restart:
        return "restart";
    case ProgressPhase::Downloading:
        return "downloading";
    case ProgressPhase::Done:
        return "done";
    }
    return "unknown";
}
