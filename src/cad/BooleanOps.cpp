/**
 * BooleanOps.cpp - Subtract and union for the compositor
 *
 * Each result is validated before it is returned; a failed or unsound
 * boolean is reported as BOOLEAN_FAILURE and never patched or retried.
 */

#include "Kernel.hpp"
#include "OCCTSolid.hpp"

#include <BRepAlgoAPI_Fuse.hxx>
#include <BRepAlgoAPI_Cut.hxx>
#include <BRepAlgoAPI_BooleanOperation.hxx>
#include <TopTools_ListOfShape.hxx>
#include <Standard_Failure.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS.hxx>

namespace keycap::core::cad::kernel {

namespace {

// Unwrap the single solid of a boolean result compound
TopoDS_Shape extractSolid(const TopoDS_Shape& shape) {
    if (shape.ShapeType() == TopAbs_SOLID) {
        return shape;
    }

    TopExp_Explorer exp(shape, TopAbs_SOLID);
    if (exp.More()) {
        TopoDS_Shape solid = exp.Current();
        exp.Next();
        if (!exp.More()) {
            return solid;
        }
    }
    return shape;
}

Result<SolidPtr> finishBoolean(BRepAlgoAPI_BooleanOperation& op, const std::string& opName) {
    op.SetRunParallel(Standard_False);
    op.Build();

    if (!op.IsDone() || op.HasErrors()) {
        return Result<SolidPtr>::error(errors::kBooleanFailure, opName + " operation failed");
    }

    SolidCheck check = checkSolid(op.Shape());
    if (!check.isSound()) {
        return Result<SolidPtr>::error(errors::kBooleanFailure,
            opName + " result is not a single sound solid: " + describeCheck(check));
    }

    return Result<SolidPtr>::ok(makeSolid(extractSolid(op.Shape())));
}

} // anonymous namespace

// =============================================================================
// Boolean Subtract
// =============================================================================

Result<SolidPtr> booleanSubtract(const SolidPtr& base, const SolidPtr& tool) {
    if (!base || !tool) {
        return Result<SolidPtr>::error(errors::kBooleanFailure, "Subtract requires two solids");
    }

    try {
        BRepAlgoAPI_Cut cut;
        TopTools_ListOfShape arguments;
        TopTools_ListOfShape tools;
        arguments.Append(getOCCT(base));
        tools.Append(getOCCT(tool));
        cut.SetArguments(arguments);
        cut.SetTools(tools);

        return finishBoolean(cut, "Subtract");

    } catch (const Standard_Failure& e) {
        return Result<SolidPtr>::error(errors::kBooleanFailure,
            std::string("Subtract raised: ") + e.GetMessageString());
    } catch (const std::exception& e) {
        return Result<SolidPtr>::error(errors::kBooleanFailure,
            std::string("Subtract raised: ") + e.what());
    }
}

// =============================================================================
// Boolean Union
// =============================================================================

Result<SolidPtr> booleanUnion(const SolidPtr& a, const SolidPtr& b) {
    if (!a || !b) {
        return Result<SolidPtr>::error(errors::kBooleanFailure, "Union requires two solids");
    }

    try {
        BRepAlgoAPI_Fuse fuse;
        TopTools_ListOfShape arguments;
        TopTools_ListOfShape tools;
        arguments.Append(getOCCT(a));
        tools.Append(getOCCT(b));
        fuse.SetArguments(arguments);
        fuse.SetTools(tools);

        return finishBoolean(fuse, "Union");

    } catch (const Standard_Failure& e) {
        return Result<SolidPtr>::error(errors::kBooleanFailure,
            std::string("Union raised: ") + e.GetMessageString());
    } catch (const std::exception& e) {
        return Result<SolidPtr>::error(errors::kBooleanFailure,
            std::string("Union raised: ") + e.what());
    }
}

} // namespace keycap::core::cad::kernel
