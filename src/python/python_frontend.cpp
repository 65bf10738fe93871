#include <boost/python.hpp>

#include "python/python_frontend.hpp"

#include <mutex>

namespace gamesmith::python {
namespace py = boost::python;
namespace {

void EnsureInterpreter() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (Py_IsInitialized()) {
            return;
        }
        Py_InitializeEx(0);
        // Hand the GIL back so any thread can take it through GilGuard.
        PyEval_SaveThread();
    });
}

class GilGuard {
public:
    GilGuard() : state_(PyGILState_Ensure()) {}
    ~GilGuard() { PyGILState_Release(state_); }

    GilGuard(const GilGuard&) = delete;
    GilGuard& operator=(const GilGuard&) = delete;

private:
    PyGILState_STATE state_;
};

std::string ToStdString(const py::object& value) {
    return py::extract<std::string>(py::str(value));
}

int ToLine(const py::object& value) {
    if (value.is_none()) {
        return 0;
    }
    py::extract<int> line(value);
    return line.check() ? line() : 0;
}

std::string TypeName(const py::object& node) {
    return py::extract<std::string>(node.attr("__class__").attr("__name__"));
}

ParseResult OutlineModule(const py::object& tree) {
    ParseResult result{};
    result.status = ParseStatus::kOk;
    const py::object body = tree.attr("body");
    const auto count = py::len(body);
    for (py::ssize_t i = 0; i < count; ++i) {
        const py::object node = body[i];
        if (TypeName(node) != "ClassDef") {
            continue;
        }
        ClassOutline outline{};
        outline.name = ToStdString(node.attr("name"));
        outline.line = ToLine(node.attr("lineno"));
        const py::object members = node.attr("body");
        const auto member_count = py::len(members);
        for (py::ssize_t j = 0; j < member_count; ++j) {
            const py::object member = members[j];
            if (TypeName(member) == "FunctionDef") {
                outline.methods.push_back(ToStdString(member.attr("name")));
            }
        }
        result.classes.push_back(std::move(outline));
    }
    return result;
}

// Converts the pending Python exception into a ParseResult and clears it.
ParseResult ResultFromPendingError() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    py::handle<> type_handle(py::allow_null(type));
    py::handle<> value_handle(py::allow_null(value));
    py::handle<> traceback_handle(py::allow_null(traceback));

    ParseResult result{};
    result.status = ParseStatus::kInternalError;
    if (!value_handle) {
        result.message = "unknown parser failure";
        return result;
    }
    const py::object error(value_handle);
    try {
        if (type_handle && PyErr_GivenExceptionMatches(type_handle.get(), PyExc_SyntaxError)) {
            result.status = ParseStatus::kSyntaxError;
            result.message = ToStdString(error.attr("msg"));
            result.line = ToLine(error.attr("lineno"));
        } else {
            result.message = ToStdString(error);
        }
    } catch (const py::error_already_set&) {
        PyErr_Clear();
        result.status = ParseStatus::kInternalError;
        result.message = "unreadable parser error";
    }
    return result;
}

}  // namespace

ParseResult PythonFrontend::Parse(const std::string& source) {
    EnsureInterpreter();
    GilGuard gil;
    try {
        const py::object ast = py::import("ast");
        // Bytes let the parser apply PEP 263 decoding and report bad UTF-8 as a SyntaxError.
        const py::object data(py::handle<>(
            PyBytes_FromStringAndSize(source.data(), static_cast<Py_ssize_t>(source.size()))));
        const py::object tree = ast.attr("parse")(data, "<game>");
        return OutlineModule(tree);
    } catch (const py::error_already_set&) {
        return ResultFromPendingError();
    }
}

}  // namespace gamesmith::python
