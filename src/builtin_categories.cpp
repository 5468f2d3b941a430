/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of tap.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#include <tap/category_table.h>

namespace tap {

std::vector<category_definition> category_table::builtin_definitions() {
  // clang-format off
  return {
      {"images", {
          ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".tif", ".svg",
          ".webp", ".ico", ".heic", ".heif", ".raw", ".cr2", ".nef", ".arw",
          ".dng", ".orf", ".rw2", ".psd", ".ai", ".eps", ".xcf", ".sketch",
          ".fig"}},
      {"documents", {
          ".doc", ".docx", ".docm", ".dot", ".dotx", ".dotm", ".pdf", ".rtf",
          ".txt", ".text", ".md", ".markdown", ".odt", ".ott", ".pages",
          ".wpd", ".wp", ".tex", ".wps", ".wri", ".abw"}},
      {"presentations", {
          ".ppt", ".pptx", ".pptm", ".pot", ".potx", ".potm", ".pps",
          ".ppsx", ".ppsm", ".ppa", ".ppam", ".odp", ".otp", ".key",
          ".gslides"}},
      {"spreadsheets", {
          ".xls", ".xlsx", ".xlsm", ".xlsb", ".xlt", ".xltx", ".xltm", ".xla",
          ".xlam", ".csv", ".tsv", ".ods", ".ots", ".numbers", ".gsheet"}},
      {"databases", {
          ".mdb", ".accdb", ".accde", ".accdt", ".accdr", ".db", ".sqlite",
          ".sqlite3", ".sql", ".dbf", ".fmp12", ".fp7"}},
      {"email", {
          ".msg", ".oft", ".ost", ".pst", ".eml", ".emlx", ".mbox", ".mbx",
          ".mailbox"}},
      {"notes", {
          ".one", ".onetoc2", ".onepkg", ".note", ".enex", ".enl", ".notion"}},
      {"publishing", {
          ".pub", ".indd", ".indt", ".qxd", ".qxp"}},
      {"diagrams", {
          ".vsd", ".vsdx", ".vsdm", ".vst", ".vstx", ".vstm", ".vss", ".vssx",
          ".vssm", ".drawio"}},
      {"project_files", {
          ".mpp", ".mpt", ".gan", ".planner"}},
      {"videos", {
          ".mp4", ".avi", ".mov", ".mkv", ".wmv", ".flv", ".webm", ".m4v",
          ".mpg", ".mpeg", ".m2v", ".3gp", ".3g2", ".mts", ".m2ts", ".ts",
          ".vob", ".ogv", ".mxf", ".roq", ".nsv", ".f4v", ".f4p", ".f4a",
          ".f4b"}},
      {"audio", {
          ".mp3", ".wav", ".flac", ".aac", ".ogg", ".m4a", ".wma", ".aiff",
          ".aif", ".aifc", ".caf", ".opus", ".ape", ".alac", ".amr", ".au",
          ".mka", ".mid", ".midi", ".ra", ".rm"}},
      {"archives", {
          ".zip", ".rar", ".7z", ".tar", ".gz", ".bz2", ".xz", ".tgz", ".tbz2",
          ".tar.gz", ".tar.bz2", ".tar.xz", ".cab", ".app.zip", ".z", ".lz",
          ".lzma", ".tlz", ".war", ".sit", ".sitx", ".sea", ".zipx"}},
      {"executables", {
          ".exe", ".msi", ".msix", ".appx", ".bat", ".cmd", ".com", ".app",
          ".dmg", ".pkg", ".command", ".workflow", ".deb", ".rpm", ".run",
          ".appimage", ".jar"}},
      {"code", {
          ".css", ".scss", ".sass", ".less", ".js", ".jsx", ".tsx", ".vue",
          ".php", ".asp", ".aspx", ".jsp", ".py", ".pyw", ".pyc", ".pyo",
          ".pyd", ".java", ".class", ".c", ".cpp", ".cc", ".cxx", ".h", ".hpp",
          ".hxx", ".cs", ".csx", ".m", ".mm", ".swift", ".rs", ".go", ".rb",
          ".erb", ".pl", ".pm", ".r", ".mat", ".sh", ".bash", ".zsh", ".fish",
          ".ps1", ".psm1", ".psd1", ".lua", ".scala", ".kt", ".kts", ".dart",
          ".vim", ".el"}},
      {"config", {
          ".ini", ".conf", ".cfg", ".config", ".properties", ".toml", ".yaml",
          ".yml", ".json", ".json5", ".jsonc", ".xml", ".plist", ".reg",
          ".env", ".editorconfig", ".gitignore", ".gitattributes",
          ".dockerignore"}},
      {"fonts", {
          ".ttf", ".otf", ".woff", ".woff2", ".eot", ".fon", ".fnt", ".dfont",
          ".suit"}},
      {"three_d", {
          ".obj", ".fbx", ".dae", ".3ds", ".blend", ".stl", ".ply", ".gltf",
          ".glb", ".usd", ".usdz", ".dwg", ".dxf", ".dwf", ".step", ".stp",
          ".iges", ".igs", ".ipt", ".iam", ".sldprt", ".sldasm", ".catpart",
          ".catproduct"}},
      {"ebooks", {
          ".epub", ".mobi", ".azw", ".azw3", ".kf8", ".ibooks", ".fb2",
          ".djvu", ".cbr", ".cbz", ".cb7", ".cbt"}},
      {"backups", {
          ".bak", ".backup", ".old", ".orig", ".tmp", ".temp", ".swp", ".swo",
          ".gho", ".bkf", ".bck"}},
      {"system", {
          ".sys", ".dll", ".ocx", ".drv", ".cpl", ".scr", ".dat", ".ds_store",
          ".localized", ".so", ".ko", ".lnk"}},
      {"virtual", {
          ".vmdk", ".vdi", ".vhd", ".vhdx", ".hdd", ".ova", ".ovf", ".qcow",
          ".qcow2", ".iso", ".img", ".toast", ".cdr"}},
      {"logs", {
          ".log", ".out", ".trace", ".dmp", ".crash", ".diag"}},
      {"certificates", {
          ".cer", ".crt", ".der", ".p7b", ".p7c", ".p12", ".pfx", ".pem",
          ".sig", ".gpg"}},
      {"web", {
          ".html", ".htm", ".mhtml", ".mht", ".url", ".webloc", ".website",
          ".download", ".crdownload", ".part"}},
      {"subtitles", {
          ".srt", ".sub", ".sbv", ".ass", ".ssa", ".vtt", ".idx"}},
      {"torrents", {
          ".torrent", ".magnet"}},
  };
  // clang-format on
}

} // namespace tap
