// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <SPIFFS.h>

class SPIFFSFile : public JsonSerializable {
    const String _filename;
    long _totalBytes = 0, _usedBytes = 0;
    bool _available = false;
    ActivationTracker _reads, _writes;
    ActivationTrackerWithDetail _failures;

public:
    explicit SPIFFSFile (const String &filename) :
        _filename (filename) { }

    bool begin () {
        if (! SPIFFS.begin (true)) {
            DEBUG_PRINTF ("SPIFFSFile[%s]::begin: failed on SPIFFS.begin (), file activity not available\n", _filename.c_str ());
            return (_available = false);
        }
        _totalBytes = SPIFFS.totalBytes ();
        _usedBytes = SPIFFS.usedBytes ();
        DEBUG_PRINTF ("SPIFFSFile[%s]::begin: totalBytes=%ld, usedBytes=%ld, exists=%d\n", _filename.c_str (), _totalBytes, _usedBytes, SPIFFS.exists (_filename));
        return (_available = true);
    }
    bool available () const {
        return _available;
    }

    std::optional<String> read () {
        if (! _available || ! SPIFFS.exists (_filename))
            return std::nullopt;
        File file = SPIFFS.open (_filename, FILE_READ);
        if (! file) {
            _failures += String ("open for read");
            DEBUG_PRINTF ("SPIFFSFile[%s]::read: failed on SPIFFS.open ()\n", _filename.c_str ());
            return std::nullopt;
        }
        const String content = file.readString ();
        file.close ();
        _reads++;
        DEBUG_PRINTF ("SPIFFSFile[%s]::read: length=%u\n", _filename.c_str (), content.length ());
        return content;
    }
    // replaces the content via a temporary so a failed write leaves the previous content in place
    bool write (const String &content) {
        if (! _available)
            return false;
        const String temporary = _filename + ".tmp";
        File file = SPIFFS.open (temporary, FILE_WRITE);
        if (! file) {
            _failures += String ("open for write");
            DEBUG_PRINTF ("SPIFFSFile[%s]::write: failed on SPIFFS.open ()\n", _filename.c_str ());
            return false;
        }
        const size_t written = file.print (content);
        file.close ();
        if (written != content.length () || (SPIFFS.exists (_filename) && ! SPIFFS.remove (_filename)) || ! SPIFFS.rename (temporary, _filename)) {
            _failures += String ("write ") + String (written) + "/" + String (content.length ());
            DEBUG_PRINTF ("SPIFFSFile[%s]::write: failed, written=%u, length=%u\n", _filename.c_str (), written, content.length ());
            SPIFFS.remove (temporary);
            return false;
        }
        _usedBytes = SPIFFS.usedBytes ();
        _writes++;
        DEBUG_PRINTF ("SPIFFSFile[%s]::write: length=%u\n", _filename.c_str (), content.length ());
        return true;
    }
    //
    void serialize (JsonVariant &obj) const override {
        obj ["available"] = _available;
        obj ["left"] = _totalBytes - _usedBytes;
        obj ["reads"] = _reads;
        obj ["writes"] = _writes;
        if (_failures)
            obj ["failures"] = _failures;
    }
};

// -----------------------------------------------------------------------------------------------

class SPIFFSScheduleStore : public ScheduleStore {
    SPIFFSFile &_file;

public:
    explicit SPIFFSScheduleStore (SPIFFSFile &file) :
        _file (file) { }
    std::optional<std::string> load () override {
        const auto content = _file.read ();
        return content.has_value () ? std::optional<std::string> (content->c_str ()) : std::nullopt;
    }
    bool save (const std::string &content) override {
        return _file.write (String (content.c_str ()));
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
