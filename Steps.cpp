#include "Steps.h"

QString stepTypeName(StepType type)
{
    switch (type) {
    case StepType::Visit:              return QStringLiteral("visit");
    case StepType::PushStack:          return QStringLiteral("push");
    case StepType::PopStack:           return QStringLiteral("pop");
    case StepType::AssignSCC:          return QStringLiteral("assign");
    case StepType::BuildCondensedEdge: return QStringLiteral("edge");
    case StepType::DepthInit:          return QStringLiteral("depth-init");
    case StepType::DepthRelax:         return QStringLiteral("depth-relax");
    case StepType::DepthEmit:          return QStringLiteral("depth-emit");
    }
    return QStringLiteral("unknown");
}
