#pragma once

#include <algorithm>
#include <string>
#include <string_view>

// Canned host-dialect (ES3 ExtendScript) bodies. Each assigns its answer to __result.
namespace galley::scripts {

    using namespace std::string_view_literals;

    inline constexpr auto document_info = R"jsx(var doc = app.activeDocument;
var sel = app.selection;
var selTypes = [];
for (var i = 0; i < sel.length && i < 20; i++) {
    selTypes.push(sel[i].constructor.name);
}
__result = {
    name: doc.name,
    fullName: doc.saved ? doc.fullName.fsName : "(unsaved)",
    saved: doc.saved,
    modified: doc.modified,
    pages: doc.pages.length,
    spreads: doc.spreads.length,
    stories: doc.stories.length,
    allPageItems: doc.allPageItems.length,
    textFrames: doc.textFrames.length,
    rectangles: doc.rectangles.length,
    ovals: doc.ovals.length,
    graphicLines: doc.graphicLines.length,
    images: doc.allGraphics.length,
    links: doc.links.length,
    layers: doc.layers.length,
    masterSpreads: doc.masterSpreads.length,
    paragraphStyles: doc.allParagraphStyles.length,
    characterStyles: doc.allCharacterStyles.length,
    objectStyles: doc.allObjectStyles.length,
    swatches: doc.swatches.length,
    selection_count: sel.length,
    selection_types: selTypes,
    documentPreferences: {
        pageWidth: doc.documentPreferences.pageWidth,
        pageHeight: doc.documentPreferences.pageHeight,
        facingPages: doc.documentPreferences.facingPages,
        pagesPerDocument: doc.documentPreferences.pagesPerDocument
    }
};
)jsx"sv;

    // Shared head of both selection bodies; FULL_DETAIL is spliced in per level.
    inline constexpr auto selection_head = R"jsx(var sel = app.selection;
var items = [];
for (var i = 0; i < sel.length && i < 50; i++) {
    var obj = sel[i];
    var item = {index: i, type: obj.constructor.name, id: obj.id || -1};
    try { item.name = obj.name || ""; } catch (e) { item.name = ""; }
    try {
        if (obj.geometricBounds) {
            var b = obj.geometricBounds;
            item.bounds = {top: b[0], left: b[1], bottom: b[2], right: b[3]};
        }
    } catch (e) {}
)jsx"sv;

    inline constexpr auto selection_basic_detail = R"jsx(    try {
        if (obj.contents && typeof obj.contents === 'string') {
            item.content_preview = obj.contents.substring(0, 200);
        }
    } catch (e) {}
)jsx"sv;

    inline constexpr auto selection_full_detail = R"jsx(    try {
        if (obj.contents && typeof obj.contents === 'string') {
            item.content_preview = obj.contents.substring(0, 500);
        }
    } catch (e) {}
    try { if (obj.appliedParagraphStyle) item.paragraphStyle = obj.appliedParagraphStyle.name; } catch (e) {}
    try { if (obj.appliedCharacterStyle) item.characterStyle = obj.appliedCharacterStyle.name; } catch (e) {}
    try { if (obj.appliedObjectStyle) item.objectStyle = obj.appliedObjectStyle.name; } catch (e) {}
    try { if (obj.fillColor) item.fillColor = obj.fillColor.name; } catch (e) {}
    try { if (obj.strokeColor) item.strokeColor = obj.strokeColor.name; } catch (e) {}
    try { if (obj.parentPage) item.page = obj.parentPage.name; } catch (e) {}
)jsx"sv;

    inline constexpr auto selection_tail = R"jsx(    items.push(item);
}
__result = {count: sel.length, items: items};
)jsx"sv;

    inline std::string selection(bool full) {
        std::string body{selection_head};
        body += full ? selection_full_detail : selection_basic_detail;
        body += selection_tail;
        return body;
    }

    // The expression is evaluated once and converted with String(), as the host console does.
    inline std::string expression(std::string_view expr) {
        std::string body{"var __r = ("};
        body += expr;
        body += ");\n"
                "if (typeof __r === 'undefined') { __result = 'undefined'; }\n"
                "else if (__r === null) { __result = 'null'; }\n"
                "else { __result = String(__r); }\n";
        return body;
    }

    /*
     * In-host side of a script call. Defines the exporter that walks the result slot into the
     * wire node table: every property read is its own try, so one faulting read costs one slot
     * ("fault"), a type name ("type_fault") or a specifier ("specifier_fault"), never the whole
     * result. Host DOM objects (anything with toSpecifier) are exported by reference and never
     * walked. Strings are escaped by hand; the host dialect has no JSON object.
     */
    inline constexpr auto exporter = R"jsx(function __galleyQuote(s) {
    var out = '', i, cc, ch;
    for (i = 0; i < s.length; i++) {
        cc = s.charCodeAt(i);
        ch = s.charAt(i);
        if      (ch === '\\') out += '\\\\';
        else if (ch === '"')  out += '\\"';
        else if (cc === 9)    out += '\\t';
        else if (cc === 10)   out += '\\n';
        else if (cc === 13)   out += '\\r';
        else if (cc < 32 || cc === 0x2028 || cc === 0x2029) out += '\\u' + ('0000' + cc.toString(16)).slice(-4);
        else                  out += ch;
    }
    return '"' + out + '"';
}

function __galleyMessage(e) {
    try {
        if (e && e.message) return String(e.message);
        return String(e);
    } catch (x) {
        return 'unreadable error';
    }
}

function __galleyFault(e, lineOffset) {
    var name = 'Error', line = -1;
    try { if (e && e.name) name = String(e.name); } catch (x) {}
    try { if (typeof e.line === 'number' && e.line > lineOffset) line = e.line - lineOffset; } catch (x) {}
    return '{"ok":false,"error":{"name":' + __galleyQuote(name) + ',"message":' +
           __galleyQuote(__galleyMessage(e)) + ',"line":' + line + '}}';
}

function __galleyExport(root) {
    var nodes = [], seen = [], ids = [];

    function add(json) {
        nodes.push(json);
        return nodes.length - 1;
    }

    function slot(read) {
        var v;
        try { v = read(); } catch (e) { return '"fault":' + __galleyQuote(__galleyMessage(e)); }
        return '"ref":' + visit(v);
    }

    function visit(v) {
        var t = typeof v, i, ctor, id, typeField, specField, isHost, isArray, parts, n, keys, k, own;
        if (t === 'undefined') return add('{"kind":"undefined"}');
        if (t === 'boolean') return add('{"kind":"boolean","boolean":' + (v ? 'true' : 'false') + '}');
        if (t === 'number') {
            if (isNaN(v)) return add('{"kind":"number","special":"nan"}');
            if (!isFinite(v)) return add('{"kind":"number","special":"' + (v > 0 ? 'inf' : '-inf') + '"}');
            return add('{"kind":"number","number":' + String(v) + '}');
        }
        if (t === 'string') return add('{"kind":"string","text":' + __galleyQuote(v) + '}');
        if (t === 'function') {
            var fname = '';
            try { fname = String(v.name || ''); } catch (e) {}
            return add('{"kind":"function","type_name":"Function","text":' + __galleyQuote(fname) + '}');
        }

        // null is told apart by its constructor read; === null misreports UnitValue
        try { ctor = v.constructor; } catch (e) { return add('{"kind":"null"}'); }

        for (i = 0; i < seen.length; i++) {
            if (seen[i] === v) return ids[i];
        }
        id = add('{"kind":"undefined"}');
        seen.push(v);
        ids.push(id);

        try { typeField = '"type_name":' + __galleyQuote(String(ctor.name)); }
        catch (e) { typeField = '"type_fault":' + __galleyQuote(__galleyMessage(e)); }

        isHost = false;
        specField = '';
        try {
            if (typeof v.toSpecifier === 'function') {
                isHost = true;
                specField = ',"specifier":' + __galleyQuote(String(v.toSpecifier()));
            }
        } catch (e) {
            isHost = true;
            specField = ',"specifier_fault":' + __galleyQuote(__galleyMessage(e));
        }
        if (isHost) {
            nodes[id] = '{"kind":"object",' + typeField + specField + '}';
            return id;
        }

        parts = [];
        isArray = false;
        try { isArray = v instanceof Array; } catch (e) {}
        if (isArray) {
            n = 0;
            try { n = v.length; } catch (e) {}
            for (i = 0; i < n; i++) {
                parts.push('{' + slot(function () { return v[i]; }) + '}');
            }
            nodes[id] = '{"kind":"array",' + typeField + ',"elements":[' + parts.join(',') + ']}';
            return id;
        }

        keys = [];
        try { for (k in v) keys.push(k); } catch (e) {}
        for (i = 0; i < keys.length; i++) {
            k = keys[i];
            own = true;
            try { own = v.hasOwnProperty(k); } catch (e) {}
            parts.push('{"key":' + __galleyQuote(String(k)) + ',' + slot(function () { return v[k]; }) +
                       (own ? '' : ',"inherited":true') + '}');
        }
        nodes[id] = '{"kind":"object",' + typeField + ',"members":[' + parts.join(',') + ']}';
        return id;
    }

    var rootId = visit(root);
    return '{"root":' + rootId + ',"nodes":[' + nodes.join(',') + ']}';
}
)jsx"sv;

    /*
     * Full program handed to the host's doScript. Dialogs are suppressed for the duration and
     * the previous interaction level comes back on both the success and the error path. The
     * body runs in its own function so an early `return` cannot skip the restore. The value
     * of the program is a response body without the id: {"ok":true,"result":<graph>} or
     * {"ok":false,"error":{name,message,line}}, with line relative to the body.
     */
    inline std::string host_program(std::string_view body, std::string_view slot) {
        std::string program{exporter};
        program += "(function () {\n"
                   "var ";
        program += slot;
        program += ";\n"
                   "var __galleyLevel = app.scriptPreferences.userInteractionLevel;\n"
                   "app.scriptPreferences.userInteractionLevel = UserInteractionLevels.neverInteract;\n"
                   "try {\n"
                   "(function () {\n";
        auto line_offset = std::ranges::count(program, '\n');

        program += body;
        program += "\n})();\n"
                   "} catch (e) {\n"
                   "try { app.scriptPreferences.userInteractionLevel = __galleyLevel; } catch (x) {}\n"
                   "return __galleyFault(e, ";
        program += std::to_string(line_offset);
        program += ");\n"
                   "}\n"
                   "app.scriptPreferences.userInteractionLevel = __galleyLevel;\n"
                   "return '{\"ok\":true,\"result\":' + __galleyExport(";
        program += slot;
        program += ") + '}';\n"
                   "})();\n";
        return program;
    }

}  // namespace galley::scripts
