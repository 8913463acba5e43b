#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the gridcore public API header for bindings.
#include "gridcore/grid_engine.h"

#ifdef EMSCRIPTEN
namespace {

using namespace gridcore;

// Grid of rowCount x columnCount empty cells with uniform sizes.
GridEngine* createGridEngine(int rowCount, int columnCount, double rowSize, double columnSize) {
    std::vector<Cell> cells;
    if (rowCount > 0 && columnCount > 0) {
        Cell last;
        last.range = CellRange::fromSingleRowColumn(rowCount - 1, columnCount - 1);
        cells.push_back(last);
    }

    CellModel model = CellModel::generate(
        cells,
        {},
        {},
        [rowSize](int) { return rowSize; },
        [columnSize](int) { return columnSize; },
        {},
        {}
    );

    GridOptions options;
    options.border.borderCollisionResolver = highestPriorityResolver;
    return new GridEngine(std::move(model), std::move(options));
}

emscripten::val valueToJs(const CellValue& value) {
    if (std::holds_alternative<bool>(value)) return emscripten::val(std::get<bool>(value));
    if (std::holds_alternative<std::int64_t>(value)) return emscripten::val(static_cast<double>(std::get<std::int64_t>(value)));
    if (std::holds_alternative<double>(value)) return emscripten::val(std::get<double>(value));
    if (std::holds_alternative<std::string>(value)) return emscripten::val(std::get<std::string>(value));
    return emscripten::val::null();
}

emscripten::val getValue(GridEngine& engine, int row, int column) {
    const Cell* cell = engine.getCellModel().getCell(row, column);
    return cell ? valueToJs(cell->value) : emscripten::val::null();
}

void setText(GridEngine& engine, int row, int column, const std::string& text) {
    engine.getCellModel().setValue(row, column, text);
}

void setNumber(GridEngine& engine, int row, int column, double number) {
    engine.getCellModel().setValue(row, column, number);
}

CellRange getCellRange(GridEngine& engine, int row, int column) {
    const Cell* cell = engine.getCellModel().getCell(row, column);
    return cell ? cell->range : CellRange::fromSingleRowColumn(row, column);
}

int getRowCount(GridEngine& engine) { return engine.getCellModel().getRowCount(); }
int getColumnCount(GridEngine& engine) { return engine.getCellModel().getColumnCount(); }
double getWidth(GridEngine& engine) { return engine.getCellModel().getWidth(); }
double getHeight(GridEngine& engine) { return engine.getCellModel().getHeight(); }
double getRowOffset(GridEngine& engine, int index) { return engine.getCellModel().getRowOffset(index); }
double getColumnOffset(GridEngine& engine, int index) { return engine.getCellModel().getColumnOffset(index); }
int getRowAtOffset(GridEngine& engine, double offset) { return engine.getCellModel().getRowAtOffset(offset); }
int getColumnAtOffset(GridEngine& engine, double offset) { return engine.getCellModel().getColumnAtOffset(offset); }
CellRange getRangeForRect(GridEngine& engine, const Rect& rect) { return engine.getCellModel().getRangeForRect(rect); }
Rect getBounds(GridEngine& engine, const CellRange& range) { return engine.getCellModel().getBounds(range); }

void resizeRows(GridEngine& engine, const std::vector<int>& indices, double size) { engine.getCellModel().resizeRows(indices, size); }
void resizeColumns(GridEngine& engine, const std::vector<int>& indices, double size) { engine.getCellModel().resizeColumns(indices, size); }
void hideRows(GridEngine& engine, const std::vector<int>& indices) { engine.getCellModel().hideRows(indices); }
void hideColumns(GridEngine& engine, const std::vector<int>& indices) { engine.getCellModel().hideColumns(indices); }
void showRows(GridEngine& engine, const std::vector<int>& indices) { engine.getCellModel().showRows(indices); }
void showColumns(GridEngine& engine, const std::vector<int>& indices) { engine.getCellModel().showColumns(indices); }
void showAll(GridEngine& engine) { engine.getCellModel().showAll(); }
void insertRows(GridEngine& engine, int before, int count) { engine.getCellModel().insertRows(before, count); }
void insertColumns(GridEngine& engine, int before, int count) { engine.getCellModel().insertColumns(before, count); }
void deleteRows(GridEngine& engine, int from, int count) { engine.getCellModel().deleteRows(from, count); }
void deleteColumns(GridEngine& engine, int from, int count) { engine.getCellModel().deleteColumns(from, count); }
bool mergeCells(GridEngine& engine, const CellRange& range) { return engine.getCellModel().mergeCells(range); }
void splitCell(GridEngine& engine, int row, int column) { engine.getCellModel().splitCell(row, column); }

bool addSelection(GridEngine& engine, const CellRange& range, int initialRow, int initialColumn, bool subtract) {
    return engine.getSelectionModel().addSelection(Selection{range, CellPosition{initialRow, initialColumn}}, true, subtract);
}
void clearSelection(GridEngine& engine) { engine.getSelectionModel().clear(); }
bool isSelected(GridEngine& engine, int row, int column) { return engine.getSelectionModel().isSelected(row, column); }
int getSelectionCount(GridEngine& engine) { return static_cast<int>(engine.getSelectionModel().getSelections().size()); }
int getPrimaryIndex(GridEngine& engine) { return engine.getSelectionModel().getPrimaryIndex(); }
CellRange getSelectionRange(GridEngine& engine, int index) {
    return engine.getSelectionModel().getSelections().at(static_cast<std::size_t>(index)).range;
}

bool moveSelection(GridEngine& engine, int deltaColumn, int deltaRow, bool jump) {
    Selection* primary = engine.getSelectionModel().getPrimary();
    return primary && engine.getSelectionModel().moveSelection(*primary, deltaColumn, deltaRow, jump);
}
bool extendSelection(GridEngine& engine, int deltaColumn, int deltaRow, bool jump) {
    Selection* primary = engine.getSelectionModel().getPrimary();
    return primary && engine.getSelectionModel().extendSelection(*primary, deltaColumn, deltaRow, jump);
}
bool moveInitial(GridEngine& engine, int deltaColumn, int deltaRow) {
    return engine.getSelectionModel().moveInitial(deltaColumn, deltaRow);
}

void setBorder(GridEngine& engine, const BorderSide& side, const BorderMask& mask, const CellRange& range) {
    Border border;
    if (mask.top) border.top = side;
    if (mask.bottom) border.bottom = side;
    if (mask.left) border.left = side;
    if (mask.right) border.right = side;
    engine.getBorderModel().setBorder(border, range);
}
void setBorderLine(GridEngine& engine, int row, int column, const BorderSide& side, const BorderMask& mask) {
    engine.getBorderModel().setBorderLine(row, column, side, mask);
}

} // namespace

EMSCRIPTEN_BINDINGS(gridcore_module) {
    emscripten::register_vector<int>("VectorInt");

    emscripten::enum_<BorderStyle>("BorderStyle")
        .value("Solid", BorderStyle::Solid)
        .value("Dotted", BorderStyle::Dotted)
        .value("Dashed", BorderStyle::Dashed)
        .value("Double", BorderStyle::Double);

    emscripten::value_object<CellRange>("CellRange")
        .field("startRow", &CellRange::startRow)
        .field("endRow", &CellRange::endRow)
        .field("startColumn", &CellRange::startColumn)
        .field("endColumn", &CellRange::endColumn);

    emscripten::value_object<Rect>("Rect")
        .field("left", &Rect::left)
        .field("top", &Rect::top)
        .field("width", &Rect::width)
        .field("height", &Rect::height);

    emscripten::value_object<Color>("Color")
        .field("red", &Color::red)
        .field("green", &Color::green)
        .field("blue", &Color::blue)
        .field("alpha", &Color::alpha);

    emscripten::value_object<BorderSide>("BorderSide")
        .field("style", &BorderSide::style)
        .field("size", &BorderSide::size)
        .field("color", &BorderSide::color)
        .field("priority", &BorderSide::priority)
        .field("isDefault", &BorderSide::isDefault);

    emscripten::value_object<BorderMask>("BorderMask")
        .field("top", &BorderMask::top)
        .field("bottom", &BorderMask::bottom)
        .field("left", &BorderMask::left)
        .field("right", &BorderMask::right);

    emscripten::class_<GridEngine>("GridEngine")
        .constructor(&createGridEngine, emscripten::allow_raw_pointers())
        .function("cleanup", &GridEngine::cleanup)
        // Cell model
        .function("getValue", &getValue)
        .function("setText", &setText)
        .function("setNumber", &setNumber)
        .function("getCellRange", &getCellRange)
        .function("getRowCount", &getRowCount)
        .function("getColumnCount", &getColumnCount)
        .function("getWidth", &getWidth)
        .function("getHeight", &getHeight)
        .function("getRowOffset", &getRowOffset)
        .function("getColumnOffset", &getColumnOffset)
        .function("getRowAtOffset", &getRowAtOffset)
        .function("getColumnAtOffset", &getColumnAtOffset)
        .function("getRangeForRect", &getRangeForRect)
        .function("getBounds", &getBounds)
        .function("resizeRows", &resizeRows)
        .function("resizeColumns", &resizeColumns)
        .function("hideRows", &hideRows)
        .function("hideColumns", &hideColumns)
        .function("showRows", &showRows)
        .function("showColumns", &showColumns)
        .function("showAll", &showAll)
        .function("insertRows", &insertRows)
        .function("insertColumns", &insertColumns)
        .function("deleteRows", &deleteRows)
        .function("deleteColumns", &deleteColumns)
        .function("mergeCells", &mergeCells)
        .function("splitCell", &splitCell)
        // Selection model
        .function("addSelection", &addSelection)
        .function("clearSelection", &clearSelection)
        .function("isSelected", &isSelected)
        .function("getSelectionCount", &getSelectionCount)
        .function("getPrimaryIndex", &getPrimaryIndex)
        .function("getSelectionRange", &getSelectionRange)
        .function("moveSelection", &moveSelection)
        .function("extendSelection", &extendSelection)
        .function("moveInitial", &moveInitial)
        // Border model
        .function("setBorder", &setBorder)
        .function("setBorderLine", &setBorderLine);
}
#endif
